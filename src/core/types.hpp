#pragma once

#include <vector>
#include <cstdint>
#include <cmath>
#include <algorithm>
#include <optional>
#include <string>
#include <utility>

namespace chromadex {

enum class ErrorCode {
    SUCCESS = 0,
    INVALID_ARGUMENT,
    INVALID_CONTENT_TYPE,
    MISSING_CONTENT_LENGTH,
    CONTENT_TOO_LARGE,
    INVALID_FORMAT,
    DIMENSION_OUT_OF_RANGE,
    TRANSIENT_FETCH,
    RATE_LIMIT_EXCEEDED,
    SERVICE_SATURATED,
    NOT_FOUND,
    STORAGE_ERROR,
    CANCELLED
};

struct Result {
    ErrorCode error = ErrorCode::SUCCESS;
    std::string message;
    // Request field the error is attributed to ("image", "url", ...).
    std::string field;
    // Seconds until a rate-limited action may be retried.
    int retry_after = 0;

    bool success() const { return error == ErrorCode::SUCCESS; }
    bool failure() const { return error != ErrorCode::SUCCESS; }

    static Result ok() { return {ErrorCode::SUCCESS, "", "", 0}; }
    static Result fail(ErrorCode code, const std::string& msg, const std::string& field = "") {
        return {code, msg, field, 0};
    }
};

struct Rgb {
    uint8_t r = 0, g = 0, b = 0;

    Rgb() = default;
    Rgb(uint8_t r, uint8_t g, uint8_t b) : r(r), g(g), b(b) {}

    bool operator==(const Rgb& o) const { return r == o.r && g == o.g && b == o.b; }
    bool operator!=(const Rgb& o) const { return !(*this == o); }

    static double distance(const Rgb& c1, const Rgb& c2) {
        double dr = static_cast<double>(c1.r) - c2.r;
        double dg = static_cast<double>(c1.g) - c2.g;
        double db = static_cast<double>(c1.b) - c2.b;
        return std::sqrt(dr * dr + dg * dg + db * db);
    }
};

struct Lab {
    double L = 0.0;
    double a = 0.0;
    double b = 0.0;

    Lab() = default;
    Lab(double L, double a, double b) : L(L), a(a), b(b) {}

    // CIE76 color difference.
    static double distance(const Lab& c1, const Lab& c2) {
        double dL = c1.L - c2.L;
        double da = c1.a - c2.a;
        double db = c1.b - c2.b;
        return std::sqrt(dL * dL + da * da + db * db);
    }
};

// Packed 8-bit RGB pixels, row-major.
class RgbImage {
public:
    RgbImage() = default;
    RgbImage(int w, int h) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 3, 0) {}
    RgbImage(int w, int h, const Rgb& fill) : width_(w), height_(h), data_(static_cast<size_t>(w) * h * 3) {
        this->fill(fill);
    }

    int width() const { return width_; }
    int height() const { return height_; }
    bool empty() const { return width_ == 0 || height_ == 0; }
    size_t pixel_count() const { return static_cast<size_t>(width_) * height_; }
    const uint8_t* data() const { return data_.data(); }
    uint8_t* data() { return data_.data(); }

    Rgb get_pixel(int x, int y) const {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return Rgb();
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 3;
        return Rgb(data_[idx], data_[idx + 1], data_[idx + 2]);
    }

    void set_pixel(int x, int y, const Rgb& c) {
        if (x < 0 || x >= width_ || y < 0 || y >= height_) return;
        const size_t idx = (static_cast<size_t>(y) * width_ + x) * 3;
        data_[idx] = c.r;
        data_[idx + 1] = c.g;
        data_[idx + 2] = c.b;
    }

    void fill(const Rgb& c) {
        for (size_t i = 0; i < pixel_count(); ++i) {
            data_[i * 3] = c.r;
            data_[i * 3 + 1] = c.g;
            data_[i * 3 + 2] = c.b;
        }
    }

    void fill_rect(int x0, int y0, int w, int h, const Rgb& c) {
        for (int y = y0; y < y0 + h; ++y) {
            for (int x = x0; x < x0 + w; ++x) {
                set_pixel(x, y, c);
            }
        }
    }

private:
    int width_ = 0;
    int height_ = 0;
    std::vector<uint8_t> data_;
};

struct ImageRef {
    std::string origin;
    std::string url_big;
    std::string url_thumb;
    std::optional<int64_t> id;

    ImageRef() = default;
    ImageRef(std::string origin, std::string url_big, std::string url_thumb)
        : origin(std::move(origin)), url_big(std::move(url_big)), url_thumb(std::move(url_thumb)) {}
};

}
