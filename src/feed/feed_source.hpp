#pragma once

#include "core/types.hpp"
#include <string>
#include <vector>

namespace chromadex {

// A paged listing of images. An empty page means the listing is exhausted.
class FeedSource {
public:
    virtual ~FeedSource() = default;
    virtual Result fetch_page(int page, std::vector<ImageRef>& out) = 0;
    virtual std::string name() const = 0;
};

}
