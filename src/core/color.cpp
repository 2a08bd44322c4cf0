#include "core/color.hpp"
#include "core/color_space.hpp"

namespace chromadex {

Color::Color(double L, double a, double b, double percentage)
    : lab_(L, a, b), percentage_(percentage), rgb_(ColorSpace::lab_to_rgb(lab_)) {}

Color Color::from_rgb(const Rgb& rgb, double percentage) {
    return Color(ColorSpace::rgb_to_lab(rgb), percentage);
}

std::string Color::hex() const {
    return ColorSpace::to_hex(rgb_);
}

void Color::set_name(const std::string& name, double distance) {
    name_ = name;
    name_distance_ = distance;
}

}
