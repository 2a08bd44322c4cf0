#include "core/color_space.hpp"
#include <cmath>
#include <algorithm>
#include <mutex>

namespace chromadex {

namespace {

// D65 reference white.
constexpr double WHITE_X = 0.95047;
constexpr double WHITE_Y = 1.0;
constexpr double WHITE_Z = 1.08883;

std::once_flag lut_once;

int hex_digit(char c) {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

}

double ColorSpace::srgb_decode_lut_[256];

void ColorSpace::init() {
    std::call_once(lut_once, []() {
        for (int i = 0; i < 256; ++i) {
            srgb_decode_lut_[i] = srgb_decode(static_cast<uint8_t>(i));
        }
    });
}

double ColorSpace::srgb_decode(uint8_t c) {
    double cv = c / 255.0;
    if (cv <= 0.04045) {
        return cv / 12.92;
    }
    return std::pow((cv + 0.055) / 1.055, 2.4);
}

double ColorSpace::srgb_encode(double c) {
    if (c <= 0.0031308) {
        return 12.92 * c;
    }
    return 1.055 * std::pow(c, 1.0 / 2.4) - 0.055;
}

double ColorSpace::srgb_to_linear(uint8_t srgb) {
    init();
    return srgb_decode_lut_[srgb];
}

double ColorSpace::linear_to_srgb(double linear) {
    return srgb_encode(std::clamp(linear, 0.0, 1.0));
}

double ColorSpace::lab_f(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta * delta * delta) {
        return std::cbrt(t);
    }
    return t / (3.0 * delta * delta) + 4.0 / 29.0;
}

double ColorSpace::lab_f_inv(double t) {
    constexpr double delta = 6.0 / 29.0;
    if (t > delta) {
        return t * t * t;
    }
    return 3.0 * delta * delta * (t - 4.0 / 29.0);
}

Lab ColorSpace::rgb_to_lab(uint8_t r, uint8_t g, uint8_t b) {
    double lr = srgb_to_linear(r);
    double lg = srgb_to_linear(g);
    double lb = srgb_to_linear(b);

    double x = 0.412453 * lr + 0.357580 * lg + 0.180423 * lb;
    double y = 0.212671 * lr + 0.715160 * lg + 0.072169 * lb;
    double z = 0.019334 * lr + 0.119193 * lg + 0.950227 * lb;

    double fx = lab_f(x / WHITE_X);
    double fy = lab_f(y / WHITE_Y);
    double fz = lab_f(z / WHITE_Z);

    return {116.0 * fy - 16.0, 500.0 * (fx - fy), 200.0 * (fy - fz)};
}

Rgb ColorSpace::lab_to_rgb(const Lab& lab) {
    double fy = (lab.L + 16.0) / 116.0;
    double fx = fy + lab.a / 500.0;
    double fz = fy - lab.b / 200.0;

    double x = WHITE_X * lab_f_inv(fx);
    double y = WHITE_Y * lab_f_inv(fy);
    double z = std::max(0.0, WHITE_Z * lab_f_inv(fz));

    double lr =  3.240481 * x - 1.537151 * y - 0.498536 * z;
    double lg = -0.969255 * x + 1.875990 * y + 0.041556 * z;
    double lb =  0.055647 * x - 0.204041 * y + 1.057311 * z;

    auto to_byte = [](double linear) {
        double v = std::round(linear_to_srgb(linear) * 255.0);
        return static_cast<uint8_t>(std::clamp(v, 0.0, 255.0));
    };

    return {to_byte(lr), to_byte(lg), to_byte(lb)};
}

bool ColorSpace::parse_hex(const std::string& hex, Rgb& out) {
    size_t offset = (!hex.empty() && hex[0] == '#') ? 1 : 0;
    if (hex.size() - offset != 6) return false;

    uint8_t channels[3];
    for (int i = 0; i < 3; ++i) {
        int hi = hex_digit(hex[offset + i * 2]);
        int lo = hex_digit(hex[offset + i * 2 + 1]);
        if (hi < 0 || lo < 0) return false;
        channels[i] = static_cast<uint8_t>(hi * 16 + lo);
    }

    out = Rgb(channels[0], channels[1], channels[2]);
    return true;
}

std::string ColorSpace::to_hex(const Rgb& rgb) {
    static const char digits[] = "0123456789abcdef";
    std::string s(6, '0');
    const uint8_t channels[3] = {rgb.r, rgb.g, rgb.b};
    for (int i = 0; i < 3; ++i) {
        s[i * 2] = digits[channels[i] >> 4];
        s[i * 2 + 1] = digits[channels[i] & 0x0F];
    }
    return s;
}

}
