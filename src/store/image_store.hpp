#pragma once

#include "core/types.hpp"
#include "core/color.hpp"
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace chromadex {

struct ImageDetail {
    ImageRef image;
    std::vector<Color> colors;
};

// Read/write contract for indexed images and their palettes.
class ImageStore {
public:
    virtual ~ImageStore() = default;

    virtual Result exists(const std::string& origin, bool& out) = 0;

    // Atomically drops any image stored under ref.origin together with its
    // colors, then inserts a fresh image row and color rows. id receives the
    // new image id.
    virtual Result replace(const ImageRef& ref, const std::vector<Color>& colors, int64_t& id) = 0;

    virtual Result get(int64_t id, std::optional<ImageRef>& out) = 0;
    virtual Result get_colors(int64_t id, std::vector<Color>& out) = 0;

    // Images ordered by the distance of their closest stored color to the
    // query, nearest first; ties by image id.
    virtual Result search_by_color(const Color& query, int limit, int offset, std::vector<ImageRef>& out) = 0;

    virtual Result count(int64_t& out) = 0;
};

}
