#pragma once

#include "core/types.hpp"
#include <cstdint>
#include <string>

namespace chromadex {

// sRGB <-> CIELAB (D65) conversions.
class ColorSpace {
public:
    static void init();

    static double srgb_to_linear(uint8_t srgb);
    static double linear_to_srgb(double linear);

    static Lab rgb_to_lab(uint8_t r, uint8_t g, uint8_t b);
    static Lab rgb_to_lab(const Rgb& rgb) { return rgb_to_lab(rgb.r, rgb.g, rgb.b); }

    // Channels are clamped to [0,255] and rounded to nearest.
    static Rgb lab_to_rgb(const Lab& lab);

    static double cie76(const Lab& c1, const Lab& c2) { return Lab::distance(c1, c2); }

    // Accepts "rrggbb" or "#rrggbb", either case.
    static bool parse_hex(const std::string& hex, Rgb& out);
    static std::string to_hex(const Rgb& rgb);

private:
    static double srgb_decode_lut_[256];

    static double srgb_decode(uint8_t c);
    static double srgb_encode(double c);

    static double lab_f(double t);
    static double lab_f_inv(double t);
};

}
