#pragma once

#include "core/types.hpp"
#include "core/color.hpp"
#include "palette/image_decoder.hpp"
#include <cstdint>
#include <vector>

namespace chromadex {

class ColorNamer;

class ClusterExtractor {
public:
    struct Config {
        int max_clusters = 12;
        double merge_threshold = 20.0;
        int thumbnail_size = 300;
        uint64_t seed = 0x5eed;
        int attempts = 3;
        int max_iterations = 20;
        double epsilon = 0.1;
    };

    struct Cluster {
        Lab centroid;
        int count = 0;
    };

    // namer may be null, in which case colors are left unnamed.
    ClusterExtractor(const Config& config, const ColorNamer* namer);

    // Palette sorted by descending percentage; percentages sum to 1.
    Result extract(const RgbImage& image, std::vector<Color>& out) const;
    Result extract_from_bytes(const std::vector<uint8_t>& bytes, const ImageDecoder& decoder,
                              std::vector<Color>& out) const;

    // Repeatedly merges the first pair (in index order) closer than threshold.
    // The larger cluster absorbs the smaller; ties keep the lower index.
    static void merge_similar(std::vector<Cluster>& clusters, double threshold);

    // Aspect-preserving shrink so both sides fit in max_side. Never upscales.
    static RgbImage downsample(const RgbImage& image, int max_side);

    const Config& config() const { return config_; }

private:
    Config config_;
    const ColorNamer* namer_;

    std::vector<Cluster> cluster(const std::vector<Lab>& pixels) const;
};

}
