#pragma once

#include "core/types.hpp"
#include <optional>
#include <string>

namespace chromadex {

// A palette entry: a Lab centroid weighted by its share of the image.
// The RGB value is derived from Lab on construction and never set directly.
class Color {
public:
    Color() : Color(0.0, 0.0, 0.0, 1.0) {}
    Color(double L, double a, double b, double percentage);
    Color(const Lab& lab, double percentage) : Color(lab.L, lab.a, lab.b, percentage) {}

    static Color from_rgb(const Rgb& rgb, double percentage = 1.0);

    double L() const { return lab_.L; }
    double a() const { return lab_.a; }
    double b() const { return lab_.b; }
    const Lab& lab() const { return lab_; }
    double percentage() const { return percentage_; }
    const Rgb& rgb() const { return rgb_; }
    std::string hex() const;

    const std::optional<std::string>& name() const { return name_; }
    const std::optional<double>& name_distance() const { return name_distance_; }
    void set_name(const std::string& name, double distance);

private:
    Lab lab_;
    double percentage_ = 1.0;
    Rgb rgb_;
    std::optional<std::string> name_;
    std::optional<double> name_distance_;
};

}
