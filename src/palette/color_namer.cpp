#include "palette/color_namer.hpp"
#include "core/color_space.hpp"
#include <algorithm>
#include <cmath>
#include <limits>
#include <numeric>
#include <stdexcept>

namespace chromadex {

ColorNamer::ColorNamer(ColorCatalog catalog) : catalog_(std::move(catalog)) {
    if (catalog_.empty()) {
        throw std::invalid_argument("color catalog is empty");
    }

    std::vector<int> indices(catalog_.size());
    std::iota(indices.begin(), indices.end(), 0);
    nodes_.reserve(catalog_.size());
    root_ = build(indices, 0, static_cast<int>(indices.size()), 0);
}

double ColorNamer::axis_value(const Lab& lab, int axis) {
    switch (axis) {
        case 0: return lab.L;
        case 1: return lab.a;
        default: return lab.b;
    }
}

double ColorNamer::squared_distance(const Lab& c1, const Lab& c2) {
    double dL = c1.L - c2.L;
    double da = c1.a - c2.a;
    double db = c1.b - c2.b;
    return dL * dL + da * da + db * db;
}

int ColorNamer::build(std::vector<int>& indices, int begin, int end, int depth) {
    if (begin >= end) return -1;

    const int axis = depth % 3;
    const auto& entries = catalog_.entries();
    std::sort(indices.begin() + begin, indices.begin() + end, [&](int lhs, int rhs) {
        double vl = axis_value(entries[lhs].lab, axis);
        double vr = axis_value(entries[rhs].lab, axis);
        if (vl != vr) return vl < vr;
        return lhs < rhs;
    });

    const int mid = begin + (end - begin) / 2;
    const int node_index = static_cast<int>(nodes_.size());
    nodes_.push_back({indices[mid], axis, -1, -1});

    int left = build(indices, begin, mid, depth + 1);
    int right = build(indices, mid + 1, end, depth + 1);
    nodes_[node_index].left = left;
    nodes_[node_index].right = right;
    return node_index;
}

void ColorNamer::search(int node, const Lab& query, int& best, double& best_d2) const {
    if (node < 0) return;

    const Node& n = nodes_[node];
    const Lab& point = catalog_.entries()[n.entry].lab;

    double d2 = squared_distance(query, point);
    if (d2 < best_d2 || (d2 == best_d2 && n.entry < best)) {
        best_d2 = d2;
        best = n.entry;
    }

    double diff = axis_value(query, n.axis) - axis_value(point, n.axis);
    int near_side = diff < 0.0 ? n.left : n.right;
    int far_side = diff < 0.0 ? n.right : n.left;

    search(near_side, query, best, best_d2);
    // Equal-distance candidates on the far side may still win the tie.
    if (diff * diff <= best_d2) {
        search(far_side, query, best, best_d2);
    }
}

ColorNamer::Match ColorNamer::nearest(const Lab& lab) const {
    int best = -1;
    double best_d2 = std::numeric_limits<double>::max();
    search(root_, lab, best, best_d2);

    Match match;
    match.index = static_cast<size_t>(best);
    match.name = catalog_.entries()[match.index].name;
    match.distance = std::sqrt(best_d2);
    return match;
}

std::vector<ColorNamer::Match> ColorNamer::nearest(const std::vector<Lab>& labs) const {
    std::vector<Match> matches;
    matches.reserve(labs.size());
    for (const auto& lab : labs) {
        matches.push_back(nearest(lab));
    }
    return matches;
}

Result ColorNamer::nearest_hex(const std::string& hex, Match& out) const {
    Rgb rgb;
    if (!ColorSpace::parse_hex(hex, rgb)) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "invalid hex color: " + hex, "color");
    }
    out = nearest(ColorSpace::rgb_to_lab(rgb));
    return Result::ok();
}

void ColorNamer::annotate(Color& color) const {
    Match match = nearest(color.lab());
    color.set_name(match.name, match.distance);
}

}
