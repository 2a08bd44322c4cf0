#include "palette/color_catalog.hpp"
#include "core/color_space.hpp"
#include <json/json.h>
#include <fstream>
#include <memory>
#include <sstream>

namespace chromadex {

namespace {

struct CatalogEntry {
    const char* name;
    const char* hex;
};

// Basic colors come first so that they win exact ties.
const CatalogEntry BUILTIN_COLORS[] = {
    {"black", "000000"},
    {"white", "ffffff"},
    {"red", "ff0000"},
    {"green", "00ff00"},
    {"blue", "0000ff"},
    {"yellow", "ffff00"},
    {"cyan", "00ffff"},
    {"magenta", "ff00ff"},
    {"gray", "808080"},
    {"silver", "c0c0c0"},
    {"maroon", "800000"},
    {"olive", "808000"},
    {"dark green", "006400"},
    {"navy blue", "000080"},
    {"purple", "800080"},
    {"teal", "008080"},
    {"orange", "ff7f00"},
    {"pink", "ffc0cb"},
    {"brown", "964b00"},
    {"absolute zero", "0048ba"},
    {"alice blue", "f0f8ff"},
    {"alizarin crimson", "e32636"},
    {"almond", "efdecd"},
    {"amaranth", "e52b50"},
    {"amber", "ffbf00"},
    {"amethyst", "9966cc"},
    {"antique white", "faebd7"},
    {"apple green", "8db600"},
    {"apricot", "fbceb1"},
    {"aqua", "00a0b0"},
    {"aquamarine", "7fffd4"},
    {"army green", "4b5320"},
    {"arsenic", "3b444b"},
    {"artichoke", "8f9779"},
    {"ash gray", "b2beb5"},
    {"asparagus", "87a96b"},
    {"auburn", "a52a2a"},
    {"aureolin", "fdee00"},
    {"azure", "007fff"},
    {"baby blue", "89cff0"},
    {"baby pink", "f4c2c2"},
    {"banana yellow", "ffe135"},
    {"battleship gray", "848482"},
    {"beige", "f5f5dc"},
    {"bistre", "3d2b1f"},
    {"bittersweet", "fe6f5e"},
    {"blond", "faf0be"},
    {"blue bell", "a2a2d0"},
    {"blush", "de5d83"},
    {"bone", "e3dac9"},
    {"bottle green", "006a4e"},
    {"brick red", "cb4154"},
    {"bright lavender", "bf94e4"},
    {"bronze", "cd7f32"},
    {"buff", "f0dc82"},
    {"burgundy", "800020"},
    {"burnt orange", "cc5500"},
    {"burnt sienna", "e97451"},
    {"burnt umber", "8a3324"},
    {"byzantium", "702963"},
    {"cadet blue", "5f9ea0"},
    {"cambridge blue", "a3c1ad"},
    {"camel", "c19a6b"},
    {"canary yellow", "ffef00"},
    {"candy apple red", "ff0800"},
    {"cardinal", "c41e3a"},
    {"carmine", "960018"},
    {"carnation pink", "ffa6c9"},
    {"carolina blue", "56a0d3"},
    {"carrot orange", "ed9121"},
    {"celadon", "ade1af"},
    {"celeste", "b2ffff"},
    {"cerise", "de3163"},
    {"cerulean", "007ba7"},
    {"champagne", "f7e7ce"},
    {"charcoal", "36454f"},
    {"chartreuse", "dfff00"},
    {"cherry blossom pink", "ffb7c5"},
    {"chestnut", "954535"},
    {"chocolate", "7b3f00"},
    {"cinnabar", "e34234"},
    {"cinnamon", "d2691e"},
    {"citrine", "e4d00a"},
    {"cobalt blue", "0047ab"},
    {"coffee", "6f4e37"},
    {"copper", "b87333"},
    {"coral", "ff7f50"},
    {"cornflower blue", "6495ed"},
    {"cornsilk", "fff8dc"},
    {"cosmic latte", "fff8e7"},
    {"cream", "fffdd0"},
    {"crimson", "dc143c"},
    {"dark blue", "00008b"},
    {"dark brown", "654321"},
    {"dark cyan", "008b8b"},
    {"dark gray", "a9a9a9"},
    {"dark khaki", "bdb76b"},
    {"dark orange", "ff8c00"},
    {"dark red", "8b0000"},
    {"dark salmon", "e9967a"},
    {"dark slate gray", "2f4f4f"},
    {"dark violet", "9400d3"},
    {"davy's gray", "555555"},
    {"deep pink", "ff1493"},
    {"deep sky blue", "00bfff"},
    {"denim", "1560bd"},
    {"desert sand", "edc9af"},
    {"dim gray", "696969"},
    {"dodger blue", "1e90ff"},
    {"ebony", "555d50"},
    {"ecru", "c2b280"},
    {"eggplant", "614051"},
    {"eggshell", "f0ead6"},
    {"electric blue", "7df9ff"},
    {"electric purple", "bf00ff"},
    {"emerald", "50c878"},
    {"fawn", "e5aa70"},
    {"fern green", "4f7942"},
    {"firebrick", "b22222"},
    {"flame", "e25822"},
    {"flax", "eedc82"},
    {"forest green", "228b22"},
    {"french raspberry", "c72c49"},
    {"fuchsia", "c154c1"},
    {"gainsboro", "dcdcdc"},
    {"gamboge", "e49b0f"},
    {"ghost white", "f8f8ff"},
    {"ginger", "b06500"},
    {"glaucous", "6082b6"},
    {"gold", "ffd700"},
    {"goldenrod", "daa520"},
    {"granite gray", "676767"},
    {"grape", "6f2da8"},
    {"grass green", "7cfc00"},
    {"gunmetal", "2a3439"},
    {"harlequin", "3fff00"},
    {"honeydew", "f0fff0"},
    {"hot pink", "ff69b4"},
    {"hunter green", "355e3b"},
    {"indigo", "4b0082"},
    {"iris", "5a4fcf"},
    {"ivory", "fffff0"},
    {"jade", "00a86b"},
    {"jasmine", "f8de7e"},
    {"jet", "343434"},
    {"jonquil", "f4ca16"},
    {"jungle green", "29ab87"},
    {"kelly green", "4cbb17"},
    {"khaki", "c3b091"},
    {"lapis lazuli", "26619c"},
    {"lavender", "e6e6fa"},
    {"lavender blush", "fff0f5"},
    {"lemon", "fff700"},
    {"lemon chiffon", "fffacd"},
    {"light blue", "add8e6"},
    {"light coral", "f08080"},
    {"light gray", "d3d3d3"},
    {"light green", "90ee90"},
    {"light pink", "ffb6c1"},
    {"light salmon", "ffa07a"},
    {"light sky blue", "87cefa"},
    {"light slate gray", "778899"},
    {"lilac", "c8a2c8"},
    {"lime", "bfff00"},
    {"linen", "faf0e6"},
    {"liver", "674c47"},
    {"magenta haze", "9f4576"},
    {"mahogany", "c04000"},
    {"maize", "fbec5d"},
    {"malachite", "0bda51"},
    {"mauve", "e0b0ff"},
    {"midnight blue", "191970"},
    {"mint", "3eb489"},
    {"mint cream", "f5fffa"},
    {"misty rose", "ffe4e1"},
    {"moss green", "8a9a5b"},
    {"mustard", "ffdb58"},
    {"navajo white", "ffdead"},
    {"neon green", "39ff14"},
    {"ochre", "cc7722"},
    {"old gold", "cfb53b"},
    {"old lace", "fdf5e6"},
    {"old rose", "c08081"},
    {"olive drab", "6b8e23"},
    {"onyx", "353839"},
    {"orchid", "da70d6"},
    {"papaya whip", "ffefd5"},
    {"pastel blue", "aec6cf"},
    {"pastel green", "77dd77"},
    {"pastel pink", "dea5a4"},
    {"pastel yellow", "fdfd96"},
    {"peach", "ffe5b4"},
    {"pear", "d1e231"},
    {"pearl", "eae0c8"},
    {"periwinkle", "ccccff"},
    {"persian blue", "1c39bb"},
    {"persimmon", "ec5800"},
    {"pewter", "8ba8b7"},
    {"pine green", "01796f"},
    {"pistachio", "93c572"},
    {"platinum", "e5e4e2"},
    {"plum", "8e4585"},
    {"powder blue", "b0e0e6"},
    {"prussian blue", "003153"},
    {"pumpkin", "ff7518"},
    {"quartz", "51484f"},
    {"raspberry", "e30b5c"},
    {"raw umber", "826644"},
    {"rose", "ff007f"},
    {"rose quartz", "aa98a9"},
    {"rosewood", "65000b"},
    {"royal blue", "4169e1"},
    {"ruby", "e0115f"},
    {"rust", "b7410e"},
    {"saffron", "f4c430"},
    {"sage", "bcb88a"},
    {"salmon", "fa8072"},
    {"sandy brown", "f4a460"},
    {"sangria", "92000a"},
    {"sapphire", "0f52ba"},
    {"scarlet", "ff2400"},
    {"sea green", "2e8b57"},
    {"seashell", "fff5ee"},
    {"sepia", "704214"},
    {"shamrock green", "009e60"},
    {"sienna", "882d17"},
    {"sky blue", "87ceeb"},
    {"slate blue", "6a5acd"},
    {"slate gray", "708090"},
    {"smoky black", "100c08"},
    {"snow", "fffafa"},
    {"spring green", "00ff7f"},
    {"steel blue", "4682b4"},
    {"straw", "e4d96f"},
    {"tan", "d2b48c"},
    {"tangerine", "f28500"},
    {"taupe", "483c32"},
    {"tea green", "d0f0c0"},
    {"terra cotta", "e2725b"},
    {"thistle", "d8bfd8"},
    {"tiffany blue", "0abab5"},
    {"timberwolf", "dbd7d2"},
    {"tomato", "ff6347"},
    {"turquoise", "40e0d0"},
    {"tuscan red", "7c4848"},
    {"ultramarine", "3f00ff"},
    {"umber", "635147"},
    {"vanilla", "f3e5ab"},
    {"vermilion", "d9381e"},
    {"violet", "7f00ff"},
    {"viridian", "40826d"},
    {"wheat", "f5deb3"},
    {"wine", "722f37"},
    {"wisteria", "c9a0dc"},
    {"xanadu", "738678"},
    {"yellow green", "9acd32"},
    {"zaffre", "0014a8"},
};

}

bool ColorCatalog::add(const std::string& name, const std::string& hex) {
    Rgb rgb;
    if (name.empty() || !ColorSpace::parse_hex(hex, rgb)) {
        return false;
    }
    entries_.push_back({name, rgb, ColorSpace::rgb_to_lab(rgb)});
    return true;
}

ColorCatalog ColorCatalog::builtin() {
    ColorCatalog catalog;
    for (const auto& entry : BUILTIN_COLORS) {
        catalog.add(entry.name, entry.hex);
    }
    return catalog;
}

Result ColorCatalog::parse_json(const std::string& text, ColorCatalog& out) {
    Json::CharReaderBuilder builder;
    std::unique_ptr<Json::CharReader> reader(builder.newCharReader());
    Json::Value root;
    std::string errors;
    if (!reader->parse(text.data(), text.data() + text.size(), &root, &errors)) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "catalog is not valid JSON: " + errors);
    }
    if (!root.isArray()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "catalog must be a JSON array");
    }

    ColorCatalog catalog;
    for (Json::ArrayIndex i = 0; i < root.size(); ++i) {
        const Json::Value& item = root[i];
        if (!item.isObject() || !item["name"].isString() || !item["hex"].isString()) {
            return Result::fail(ErrorCode::INVALID_FORMAT,
                                "catalog entry " + std::to_string(i) + " needs string \"name\" and \"hex\"");
        }
        if (!catalog.add(item["name"].asString(), item["hex"].asString())) {
            return Result::fail(ErrorCode::INVALID_FORMAT,
                                "catalog entry " + std::to_string(i) + " has an invalid hex code");
        }
    }
    if (catalog.empty()) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "catalog is empty");
    }

    out = std::move(catalog);
    return Result::ok();
}

Result ColorCatalog::load_json(const std::string& path, ColorCatalog& out) {
    std::ifstream in(path);
    if (!in) {
        return Result::fail(ErrorCode::NOT_FOUND, "cannot open catalog file: " + path);
    }
    std::ostringstream ss;
    ss << in.rdbuf();
    return parse_json(ss.str(), out);
}

}
