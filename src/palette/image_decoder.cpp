#include "palette/image_decoder.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>
#include <opencv2/imgproc.hpp>
#include <string>

namespace chromadex {

namespace {

const char* const INVALID_FORMAT_MESSAGE = "Invalid image format.";

std::string size_text(int width, int height) {
    return std::to_string(width) + " x " + std::to_string(height);
}

}

bool ImageDecoder::mat_to_image(const cv::Mat& mat, RgbImage& out) {
    if (mat.empty()) return false;

    cv::Mat mat8 = mat;
    if (mat.depth() == CV_16U) {
        mat.convertTo(mat8, CV_8U, 1.0 / 257.0);
    } else if (mat.depth() != CV_8U) {
        return false;
    }

    // Alpha is dropped; fully transparent pixels keep their stored color.
    cv::Mat rgb_mat;
    if (mat8.channels() == 3) {
        cv::cvtColor(mat8, rgb_mat, cv::COLOR_BGR2RGB);
    } else if (mat8.channels() == 4) {
        cv::cvtColor(mat8, rgb_mat, cv::COLOR_BGRA2RGB);
    } else if (mat8.channels() == 1) {
        cv::cvtColor(mat8, rgb_mat, cv::COLOR_GRAY2RGB);
    } else {
        return false;
    }

    const int w = rgb_mat.cols;
    const int h = rgb_mat.rows;
    if (out.width() != w || out.height() != h) {
        out = RgbImage(w, h);
    }

    for (int y = 0; y < h; ++y) {
        const cv::Vec3b* row = rgb_mat.ptr<cv::Vec3b>(y);
        for (int x = 0; x < w; ++x) {
            out.set_pixel(x, y, Rgb(row[x][0], row[x][1], row[x][2]));
        }
    }
    return true;
}

Result ImageDecoder::decode_unchecked(const std::vector<uint8_t>& bytes, RgbImage& out) {
    if (bytes.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, INVALID_FORMAT_MESSAGE, "image");
    }

    cv::Mat decoded;
    try {
        cv::Mat raw(1, static_cast<int>(bytes.size()), CV_8UC1, const_cast<uint8_t*>(bytes.data()));
        decoded = cv::imdecode(raw, cv::IMREAD_UNCHANGED);
    } catch (const cv::Exception&) {
        return Result::fail(ErrorCode::INVALID_FORMAT, INVALID_FORMAT_MESSAGE, "image");
    }

    if (decoded.empty() || !mat_to_image(decoded, out)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, INVALID_FORMAT_MESSAGE, "image");
    }
    return Result::ok();
}

Result ImageDecoder::decode(const std::vector<uint8_t>& bytes, RgbImage& out) const {
    RgbImage decoded;
    Result result = decode_unchecked(bytes, decoded);
    if (result.failure()) return result;

    result = validate_dimensions(decoded.width(), decoded.height());
    if (result.failure()) return result;

    out = std::move(decoded);
    return Result::ok();
}

Result ImageDecoder::validate_dimensions(int width, int height) const {
    if (width > config_.max_width || height > config_.max_height) {
        return Result::fail(ErrorCode::DIMENSION_OUT_OF_RANGE,
                            "Maximum allowed image size is " +
                                size_text(config_.max_width, config_.max_height) +
                                " pixels, currently it's " + size_text(width, height),
                            "image");
    }
    if (width < config_.min_width || height < config_.min_height) {
        return Result::fail(ErrorCode::DIMENSION_OUT_OF_RANGE,
                            "Minimum allowed image size is " +
                                size_text(config_.min_width, config_.min_height) +
                                " pixels, currently it's " + size_text(width, height),
                            "image");
    }
    return Result::ok();
}

}
