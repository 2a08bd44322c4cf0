#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <vector>

namespace cv {
class Mat;
}

namespace chromadex {

class ImageDecoder {
public:
    struct Config {
        int min_width = 50;
        int min_height = 50;
        int max_width = 8000;
        int max_height = 8000;
    };

    ImageDecoder() = default;
    explicit ImageDecoder(const Config& config) : config_(config) {}

    // Decodes JPEG/PNG bytes in any channel layout to RGB, then checks the
    // dimension bounds.
    Result decode(const std::vector<uint8_t>& bytes, RgbImage& out) const;

    // Decodes without the dimension check.
    static Result decode_unchecked(const std::vector<uint8_t>& bytes, RgbImage& out);

    Result validate_dimensions(int width, int height) const;

    // 8- or 16-bit gray, BGR or BGRA to RGB. False for other layouts.
    static bool mat_to_image(const cv::Mat& mat, RgbImage& out);

    const Config& config() const { return config_; }

private:
    Config config_;
};

}
