#pragma once

#include "core/types.hpp"
#include "core/stop_token.hpp"
#include "core/worker_pool.hpp"
#include "feed/feed_source.hpp"
#include "net/image_fetcher.hpp"
#include "palette/cluster_extractor.hpp"
#include "palette/image_decoder.hpp"
#include "store/image_store.hpp"
#include <atomic>
#include <mutex>
#include <thread>
#include <vector>

namespace chromadex {

// Pulls pages from a feed, extracts a palette for every listed image and
// persists it. Pages are processed one at a time; images within a page run
// concurrently.
class IndexingPipeline {
public:
    struct Config {
        double periodicity_sec = 600.0;
        bool rewrite_existing = false;
        int start_page = 1;
        // 0 means unbounded.
        int end_page = 300;
        bool cyclic = true;
    };

    struct RunStats {
        int pages = 0;
        int indexed = 0;
        int skipped = 0;
        int failed = 0;
        int cycles = 0;
    };

    enum class Outcome {
        Indexed,
        Skipped,
        Failed,
        Cancelled
    };

    IndexingPipeline(const Config& config, FeedSource& feed, ImageStore& store,
                     const ImageFetcher& fetcher, const ImageDecoder& decoder,
                     const ClusterExtractor& extractor, WorkerPool& pool);
    ~IndexingPipeline();

    IndexingPipeline(const IndexingPipeline&) = delete;
    IndexingPipeline& operator=(const IndexingPipeline&) = delete;

    // Runs until the feed is exhausted (non-cyclic) or stop is requested.
    RunStats run(const StopToken& stop);

    // Runs on a background thread until stop() is called or a non-cyclic
    // run ends on its own.
    void start();
    void stop();
    bool running() const;

    Outcome index(const ImageRef& ref, const StopToken& stop);

    RunStats stats() const;
    const Config& config() const { return config_; }

private:
    Config config_;
    FeedSource& feed_;
    ImageStore& store_;
    const ImageFetcher& fetcher_;
    const ImageDecoder& decoder_;
    const ClusterExtractor& extractor_;
    WorkerPool& pool_;

    mutable std::mutex stats_mutex_;
    RunStats stats_;

    StopToken stop_;
    std::thread thread_;
    std::atomic<bool> running_{false};

    void index_page(const std::vector<ImageRef>& refs, const StopToken& stop);
    void record(Outcome outcome);
    bool pause(const StopToken& stop) const;
};

}
