#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chromadex {

struct NamedColor {
    std::string name;
    Rgb rgb;
    Lab lab;
};

// Immutable list of reference colors, in insertion order.
class ColorCatalog {
public:
    ColorCatalog() = default;

    static ColorCatalog builtin();

    // Reads a JSON array of {"name": ..., "hex": "#rrggbb"} objects.
    static Result load_json(const std::string& path, ColorCatalog& out);
    static Result parse_json(const std::string& text, ColorCatalog& out);

    const std::vector<NamedColor>& entries() const { return entries_; }
    size_t size() const { return entries_.size(); }
    bool empty() const { return entries_.empty(); }

private:
    std::vector<NamedColor> entries_;

    bool add(const std::string& name, const std::string& hex);
};

}
