#pragma once

#include "core/types.hpp"
#include "core/color.hpp"
#include "palette/color_catalog.hpp"
#include <string>
#include <vector>

namespace chromadex {

// Exact nearest-name lookup over a color catalog, using a 3-d tree in Lab
// space. Immutable after construction, so lookups may run concurrently.
class ColorNamer {
public:
    struct Match {
        std::string name;
        double distance = 0.0;
        size_t index = 0;
    };

    explicit ColorNamer(ColorCatalog catalog);

    // Ties resolve to the entry inserted first.
    Match nearest(const Lab& lab) const;
    std::vector<Match> nearest(const std::vector<Lab>& labs) const;
    Result nearest_hex(const std::string& hex, Match& out) const;

    void annotate(Color& color) const;

    const ColorCatalog& catalog() const { return catalog_; }

private:
    struct Node {
        int entry = -1;
        int axis = 0;
        int left = -1;
        int right = -1;
    };

    ColorCatalog catalog_;
    std::vector<Node> nodes_;
    int root_ = -1;

    int build(std::vector<int>& indices, int begin, int end, int depth);
    void search(int node, const Lab& query, int& best, double& best_d2) const;

    static double axis_value(const Lab& lab, int axis);
    static double squared_distance(const Lab& c1, const Lab& c2);
};

}
