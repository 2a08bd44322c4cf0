#include "palette/cluster_extractor.hpp"
#include "palette/color_namer.hpp"
#include "core/color_space.hpp"
#include <opencv2/core.hpp>
#include <opencv2/imgproc.hpp>
#include <algorithm>
#include <cmath>

namespace chromadex {

ClusterExtractor::ClusterExtractor(const Config& config, const ColorNamer* namer)
    : config_(config), namer_(namer) {
    ColorSpace::init();
}

RgbImage ClusterExtractor::downsample(const RgbImage& image, int max_side) {
    if (image.empty() || max_side <= 0) return image;
    if (image.width() <= max_side && image.height() <= max_side) return image;

    double scale = std::min(static_cast<double>(max_side) / image.width(),
                            static_cast<double>(max_side) / image.height());
    int new_w = std::max(1, static_cast<int>(std::lround(image.width() * scale)));
    int new_h = std::max(1, static_cast<int>(std::lround(image.height() * scale)));
    new_w = std::min(new_w, max_side);
    new_h = std::min(new_h, max_side);

    cv::Mat src(image.height(), image.width(), CV_8UC3, const_cast<uint8_t*>(image.data()));
    cv::Mat dst;
    cv::resize(src, dst, cv::Size(new_w, new_h), 0, 0, cv::INTER_AREA);

    RgbImage out(new_w, new_h);
    for (int y = 0; y < new_h; ++y) {
        const cv::Vec3b* row = dst.ptr<cv::Vec3b>(y);
        for (int x = 0; x < new_w; ++x) {
            out.set_pixel(x, y, Rgb(row[x][0], row[x][1], row[x][2]));
        }
    }
    return out;
}

std::vector<ClusterExtractor::Cluster> ClusterExtractor::cluster(const std::vector<Lab>& pixels) const {
    const int n = static_cast<int>(pixels.size());
    const int k = std::max(1, std::min(config_.max_clusters, n));

    cv::Mat samples(n, 3, CV_32F);
    for (int i = 0; i < n; ++i) {
        float* row = samples.ptr<float>(i);
        row[0] = static_cast<float>(pixels[i].L);
        row[1] = static_cast<float>(pixels[i].a);
        row[2] = static_cast<float>(pixels[i].b);
    }

    // cv::kmeans draws from the calling thread's RNG.
    cv::theRNG().state = config_.seed;

    cv::Mat labels;
    cv::Mat centers;
    cv::TermCriteria criteria(cv::TermCriteria::EPS + cv::TermCriteria::COUNT,
                              config_.max_iterations, config_.epsilon);
    cv::kmeans(samples, k, labels, criteria, config_.attempts, cv::KMEANS_PP_CENTERS, centers);

    std::vector<int> counts(static_cast<size_t>(k), 0);
    for (int i = 0; i < n; ++i) {
        int label = labels.at<int>(i);
        if (label >= 0 && label < k) {
            ++counts[label];
        }
    }

    std::vector<Cluster> clusters;
    clusters.reserve(static_cast<size_t>(k));
    for (int c = 0; c < k; ++c) {
        if (counts[c] == 0) continue;
        const float* center = centers.ptr<float>(c);
        clusters.push_back({Lab(center[0], center[1], center[2]), counts[c]});
    }
    return clusters;
}

void ClusterExtractor::merge_similar(std::vector<Cluster>& clusters, double threshold) {
    bool merged = true;
    while (merged) {
        merged = false;
        for (size_t i = 0; i < clusters.size() && !merged; ++i) {
            for (size_t j = i + 1; j < clusters.size(); ++j) {
                if (Lab::distance(clusters[i].centroid, clusters[j].centroid) >= threshold) continue;

                if (clusters[i].count >= clusters[j].count) {
                    clusters[i].count += clusters[j].count;
                    clusters.erase(clusters.begin() + static_cast<long>(j));
                } else {
                    clusters[j].count += clusters[i].count;
                    clusters.erase(clusters.begin() + static_cast<long>(i));
                }
                merged = true;
                break;
            }
        }
    }
}

Result ClusterExtractor::extract(const RgbImage& image, std::vector<Color>& out) const {
    out.clear();
    if (image.empty()) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "cannot extract colors from an empty image", "image");
    }

    RgbImage thumb = downsample(image, config_.thumbnail_size);
    const int total = static_cast<int>(thumb.pixel_count());
    const uint8_t* src = thumb.data();

    std::vector<Lab> pixels(static_cast<size_t>(total));
#ifdef HAS_OPENMP
    #pragma omp parallel for
#endif
    for (int i = 0; i < total; ++i) {
        int idx = i * 3;
        pixels[i] = ColorSpace::rgb_to_lab(src[idx], src[idx + 1], src[idx + 2]);
    }

    std::vector<Cluster> clusters = cluster(pixels);
    merge_similar(clusters, config_.merge_threshold);

    long long survivors = 0;
    for (const auto& c : clusters) survivors += c.count;
    if (survivors <= 0) {
        return Result::fail(ErrorCode::INVALID_FORMAT, "no pixels were clustered", "image");
    }

    out.reserve(clusters.size());
    for (const auto& c : clusters) {
        Color color(c.centroid, static_cast<double>(c.count) / static_cast<double>(survivors));
        if (namer_) {
            namer_->annotate(color);
        }
        out.push_back(std::move(color));
    }

    std::stable_sort(out.begin(), out.end(), [](const Color& lhs, const Color& rhs) {
        return lhs.percentage() > rhs.percentage();
    });
    return Result::ok();
}

Result ClusterExtractor::extract_from_bytes(const std::vector<uint8_t>& bytes, const ImageDecoder& decoder,
                                            std::vector<Color>& out) const {
    RgbImage image;
    Result result = decoder.decode(bytes, image);
    if (result.failure()) return result;
    return extract(image, out);
}

}
