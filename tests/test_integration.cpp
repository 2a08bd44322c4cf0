#include <iostream>
#include <cassert>
#include <cmath>
#include <algorithm>
#include <atomic>
#include <chrono>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <vector>
#include <stdexcept>
#include <thread>

#include <opencv2/core.hpp>
#include <opencv2/imgcodecs.hpp>

#include "../src/core/types.hpp"
#include "../src/core/color.hpp"
#include "../src/core/color_space.hpp"
#include "../src/core/log.hpp"
#include "../src/core/stop_token.hpp"
#include "../src/core/worker_pool.hpp"
#include "../src/palette/color_catalog.hpp"
#include "../src/palette/color_namer.hpp"
#include "../src/palette/cluster_extractor.hpp"
#include "../src/palette/image_decoder.hpp"
#include "../src/net/http_client.hpp"
#include "../src/net/image_fetcher.hpp"
#include "../src/feed/feed_source.hpp"
#include "../src/store/sqlite_image_store.hpp"
#include "../src/indexer/indexing_pipeline.hpp"
#include "../src/service/admission.hpp"
#include "../src/service/palette_service.hpp"
#include "../src/service/api_router.hpp"

using namespace chromadex;

#define TEST(name) static void test_##name()
#define RUN_TEST(name) do { \
    std::cout << "Running " #name "... "; \
    try { \
        test_##name(); \
        std::cout << "PASSED\n"; \
    } catch (const std::exception& e) { \
        std::cout << "FAILED: " << e.what() << "\n"; \
        failures++; \
    } catch (...) { \
        std::cout << "FAILED: unknown exception\n"; \
        failures++; \
    } \
} while(0)

int failures = 0;

// PNG with the left half in one color and the right half in another.
static std::vector<uint8_t> make_png(int w, int h, const Rgb& left, const Rgb& right) {
    cv::Mat mat(h, w, CV_8UC3);
    for (int y = 0; y < h; ++y) {
        cv::Vec3b* row = mat.ptr<cv::Vec3b>(y);
        for (int x = 0; x < w; ++x) {
            const Rgb& c = x < w / 2 ? left : right;
            row[x] = cv::Vec3b(c.b, c.g, c.r);
        }
    }
    std::vector<uint8_t> out;
    if (!cv::imencode(".png", mat, out)) {
        throw std::runtime_error("png encoding failed");
    }
    return out;
}

static std::vector<uint8_t> solid_png(int w, int h, const Rgb& c) {
    return make_png(w, h, c, c);
}

// Serves registered byte blobs by URL; unknown URLs get a 404.
class FakeImageHost : public HttpClient {
public:
    void serve(const std::string& url, std::vector<uint8_t> bytes, const std::string& type = "image/png") {
        std::lock_guard<std::mutex> lock(mutex_);
        files_[url] = {std::move(bytes), type};
    }

    HttpOutcome get(const HttpRequest& request, HttpBodyHandler& handler) override {
        ++requests;
        File file;
        bool found = false;
        {
            std::lock_guard<std::mutex> lock(mutex_);
            auto it = files_.find(request.url);
            if (it != files_.end()) {
                file = it->second;
                found = true;
            }
        }

        HttpOutcome outcome;
        HttpResponseHead head;
        head.status = found ? 200 : 404;
        if (found) {
            head.headers["content-type"] = file.type;
            head.headers["content-length"] = std::to_string(file.bytes.size());
        }
        outcome.status = head.status;
        if (!handler.on_head(head)) {
            outcome.kind = HttpOutcome::Kind::Aborted;
            return outcome;
        }
        if (!file.bytes.empty() && !handler.on_data(file.bytes.data(), file.bytes.size())) {
            outcome.kind = HttpOutcome::Kind::Aborted;
        }
        return outcome;
    }

    std::atomic<int> requests{0};

private:
    struct File {
        std::vector<uint8_t> bytes;
        std::string type;
    };
    std::mutex mutex_;
    std::map<std::string, File> files_;
};

// Pages 1..N from a fixed table; later pages are empty. Optionally requests
// a stop after a number of calls.
class FakeFeed : public FeedSource {
public:
    Result fetch_page(int page, std::vector<ImageRef>& out) override {
        ++calls;
        requested.push_back(page);
        call_times.push_back(std::chrono::steady_clock::now());
        if (stop_ && calls >= stop_after_) stop_->request_stop();
        if (fail_next_ > 0) {
            --fail_next_;
            return Result::fail(ErrorCode::TRANSIENT_FETCH, "feed unavailable");
        }
        auto it = pages.find(page);
        out = it == pages.end() ? std::vector<ImageRef>() : it->second;
        return Result::ok();
    }

    std::string name() const override { return "fake"; }

    void stop_after(StopToken& stop, int calls_before_stop) {
        stop_ = &stop;
        stop_after_ = calls_before_stop;
    }
    void fail_next(int n) { fail_next_ = n; }

    std::map<int, std::vector<ImageRef>> pages;
    std::vector<int> requested;
    std::vector<std::chrono::steady_clock::time_point> call_times;
    int calls = 0;

private:
    StopToken* stop_ = nullptr;
    int stop_after_ = 0;
    int fail_next_ = 0;
};

static ImageRef ref_for(const std::string& name) {
    return ImageRef("https://photos.example.com/" + name, "https://cdn.example.com/" + name + ".png",
                    "https://cdn.example.com/" + name + "-thumb.png");
}

// Everything a pipeline or service needs, wired over in-memory fakes.
struct Fixture {
    ColorNamer namer{ColorCatalog::builtin()};
    ImageDecoder decoder;
    ClusterExtractor extractor{ClusterExtractor::Config(), &namer};
    FakeImageHost host;
    ImageFetcher fetcher;
    SqliteImageStore store;
    WorkerPool pool{2};

    static ImageFetcher::Config fetcher_config() {
        ImageFetcher::Config cfg;
        cfg.retry.max_attempts = 2;
        cfg.retry.wait_sec = 0.0;
        return cfg;
    }

    static SqliteImageStore::Config memory_store() {
        SqliteImageStore::Config cfg;
        cfg.path = ":memory:";
        return cfg;
    }

    Fixture() : fetcher(fetcher_config(), host, decoder), store(memory_store()) {
        pool.warm_up();
    }

    IndexingPipeline::Config pipeline_config(bool cyclic, bool rewrite) const {
        IndexingPipeline::Config cfg;
        cfg.periodicity_sec = 0.0;
        cfg.start_page = 1;
        cfg.end_page = 0;
        cfg.cyclic = cyclic;
        cfg.rewrite_existing = rewrite;
        return cfg;
    }

    int64_t count() {
        int64_t n = 0;
        Result r = store.count(n);
        assert(r.success());
        return n;
    }
};

TEST(store_round_trip) {
    Fixture f;
    std::vector<Color> colors = {Color::from_rgb(Rgb(255, 0, 0), 0.25), Color::from_rgb(Rgb(0, 0, 255), 0.75)};
    colors[1].set_name("blue", 0.0);

    int64_t id = 0;
    assert(f.store.replace(ref_for("a"), colors, id).success());
    assert(id > 0);

    bool exists = false;
    assert(f.store.exists("https://photos.example.com/a", exists).success());
    assert(exists);
    assert(f.store.exists("https://photos.example.com/zzz", exists).success());
    assert(!exists);

    std::optional<ImageRef> ref;
    assert(f.store.get(id, ref).success());
    assert(ref && ref->id && *ref->id == id);
    assert(ref->url_thumb == "https://cdn.example.com/a-thumb.png");

    std::vector<Color> stored;
    assert(f.store.get_colors(id, stored).success());
    assert(stored.size() == 2);
    assert(std::abs(stored[0].percentage() - 0.75) < 1e-12);
    assert(stored[0].name() && *stored[0].name() == "blue");
    assert(!stored[1].name());

    assert(f.store.get(id + 1000, ref).success());
    assert(!ref);
}

TEST(store_replace_drops_old_colors) {
    Fixture f;
    int64_t first = 0;
    int64_t second = 0;
    assert(f.store.replace(ref_for("a"), {Color::from_rgb(Rgb(1, 1, 1), 1.0)}, first).success());
    assert(f.store.replace(ref_for("a"),
                           {Color::from_rgb(Rgb(9, 9, 9), 0.5), Color::from_rgb(Rgb(200, 9, 9), 0.5)}, second)
               .success());
    assert(second != first);
    assert(f.count() == 1);

    std::vector<Color> colors;
    assert(f.store.get_colors(first, colors).success());
    assert(colors.empty());
    assert(f.store.get_colors(second, colors).success());
    assert(colors.size() == 2);
}

TEST(store_search_orders_by_distance) {
    Fixture f;
    int64_t red = 0, blue = 0, pink = 0, red_too = 0;
    assert(f.store.replace(ref_for("red"), {Color::from_rgb(Rgb(255, 0, 0), 1.0)}, red).success());
    assert(f.store.replace(ref_for("blue"), {Color::from_rgb(Rgb(0, 0, 255), 1.0)}, blue).success());
    assert(f.store.replace(ref_for("pink"), {Color::from_rgb(Rgb(255, 120, 140), 1.0)}, pink).success());
    assert(f.store.replace(ref_for("red2"), {Color::from_rgb(Rgb(255, 0, 0), 1.0)}, red_too).success());

    std::vector<ImageRef> refs;
    assert(f.store.search_by_color(Color::from_rgb(Rgb(255, 0, 0)), 10, 0, refs).success());
    assert(refs.size() == 4);
    // Equal distances fall back to id order.
    assert(*refs[0].id == red);
    assert(*refs[1].id == red_too);
    assert(*refs[2].id == pink);
    assert(*refs[3].id == blue);

    assert(f.store.search_by_color(Color::from_rgb(Rgb(255, 0, 0)), 2, 1, refs).success());
    assert(refs.size() == 2);
    assert(*refs[0].id == red_too);
}

TEST(pipeline_non_cyclic_terminates) {
    Fixture f;
    f.host.serve(ref_for("red").url_big, solid_png(80, 60, Rgb(220, 20, 30)));
    f.host.serve(ref_for("split").url_big, make_png(120, 90, Rgb(0, 0, 0), Rgb(255, 255, 255)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("red"), ref_for("split")};

    IndexingPipeline pipeline(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder, f.extractor,
                              f.pool);
    StopToken stop;
    IndexingPipeline::RunStats stats = pipeline.run(stop);

    assert(stats.pages == 1);
    assert(stats.indexed == 2);
    assert(stats.failed == 0);
    assert(feed.requested == std::vector<int>({1, 2}));
    assert(f.count() == 2);

    std::vector<ImageRef> refs;
    assert(f.store.search_by_color(Color::from_rgb(Rgb(255, 255, 255)), 1, 0, refs).success());
    assert(refs.size() == 1);
    assert(refs[0].origin == ref_for("split").origin);

    std::vector<Color> colors;
    assert(f.store.get_colors(*refs[0].id, colors).success());
    assert(colors.size() == 2);
}

TEST(pipeline_bounded_range) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(10, 200, 10)));
    f.host.serve(ref_for("b").url_big, solid_png(60, 60, Rgb(10, 10, 200)));

    FakeFeed feed;
    feed.pages[2] = {ref_for("a")};
    feed.pages[3] = {ref_for("b")};
    feed.pages[4] = {ref_for("a")};

    IndexingPipeline::Config cfg = f.pipeline_config(false, false);
    cfg.start_page = 2;
    cfg.end_page = 3;
    IndexingPipeline pipeline(cfg, feed, f.store, f.fetcher, f.decoder, f.extractor, f.pool);
    StopToken stop;
    IndexingPipeline::RunStats stats = pipeline.run(stop);

    assert(feed.requested == std::vector<int>({2, 3}));
    assert(stats.pages == 2);
    assert(stats.indexed == 2);
}

TEST(pipeline_cyclic_loops_until_stopped) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(240, 240, 0)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("a")};

    IndexingPipeline::Config cfg = f.pipeline_config(true, false);
    cfg.periodicity_sec = 0.05;
    IndexingPipeline pipeline(cfg, feed, f.store, f.fetcher, f.decoder, f.extractor, f.pool);

    StopToken stop;
    feed.stop_after(stop, 6);
    IndexingPipeline::RunStats stats = pipeline.run(stop);

    assert(feed.calls == 6);
    // Every page request, including the one after a wrap, follows a full pause.
    const auto pause = std::chrono::milliseconds(50);
    for (size_t i = 1; i < feed.call_times.size(); ++i) {
        assert(feed.call_times[i] - feed.call_times[i - 1] >= pause);
    }
    assert(feed.call_times.back() - feed.call_times.front() >= 5 * pause);
    assert(feed.requested[0] == 1 && feed.requested[1] == 2 && feed.requested[2] == 1);
    assert(stats.cycles >= 2);
    assert(stats.indexed == 1);
    assert(stats.skipped >= 1);
    assert(f.count() == 1);
}

TEST(pipeline_retries_failed_page) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(40, 40, 40)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("a")};
    feed.fail_next(2);

    IndexingPipeline pipeline(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder, f.extractor,
                              f.pool);
    StopToken stop;
    IndexingPipeline::RunStats stats = pipeline.run(stop);

    assert(feed.requested == std::vector<int>({1, 1, 1, 2}));
    assert(stats.indexed == 1);
}

TEST(pipeline_idempotence) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(200, 100, 50)));
    f.host.serve(ref_for("b").url_big, solid_png(60, 60, Rgb(50, 100, 200)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("a"), ref_for("b")};
    StopToken stop;

    {
        IndexingPipeline first(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder,
                               f.extractor, f.pool);
        assert(first.run(stop).indexed == 2);
    }
    int fetched = f.host.requests.load();

    {
        IndexingPipeline again(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder,
                               f.extractor, f.pool);
        IndexingPipeline::RunStats stats = again.run(stop);
        assert(stats.indexed == 0);
        assert(stats.skipped == 2);
        assert(f.host.requests.load() == fetched);
    }
    assert(f.count() == 2);

    // The image behind "a" changed since it was indexed.
    const Rgb repainted(20, 220, 90);
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, repainted));
    {
        IndexingPipeline rewrite(f.pipeline_config(false, true), feed, f.store, f.fetcher, f.decoder,
                                 f.extractor, f.pool);
        IndexingPipeline::RunStats stats = rewrite.run(stop);
        assert(stats.indexed == 2);
        assert(stats.skipped == 0);
        assert(f.host.requests.load() == fetched + 2);
    }
    assert(f.count() == 2);

    std::vector<ImageRef> refs;
    assert(f.store.search_by_color(Color::from_rgb(repainted), 1, 0, refs).success());
    assert(refs.size() == 1);
    assert(refs[0].origin == ref_for("a").origin);

    std::vector<Color> colors;
    assert(f.store.get_colors(*refs[0].id, colors).success());
    assert(colors.size() == 1);
    assert(Rgb::distance(colors[0].rgb(), repainted) < 10.0);
    assert(Rgb::distance(colors[0].rgb(), Rgb(200, 100, 50)) > 10.0);
}

TEST(pipeline_skips_bad_images) {
    Fixture f;
    f.host.serve(ref_for("tiny").url_big, solid_png(10, 10, Rgb(1, 2, 3)));
    f.host.serve(ref_for("gif").url_big, solid_png(60, 60, Rgb(1, 2, 3)), "image/gif");
    f.host.serve(ref_for("ok").url_big, solid_png(60, 60, Rgb(90, 20, 150)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("tiny"), ref_for("missing"), ref_for("gif"), ref_for("ok")};

    IndexingPipeline pipeline(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder, f.extractor,
                              f.pool);
    StopToken stop;
    IndexingPipeline::RunStats stats = pipeline.run(stop);
    assert(stats.indexed == 1);
    assert(stats.failed == 3);
    assert(f.count() == 1);
}

TEST(pipeline_background_start_stop) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(0, 128, 128)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("a")};

    IndexingPipeline::Config cfg = f.pipeline_config(true, false);
    cfg.periodicity_sec = 60.0;
    IndexingPipeline pipeline(cfg, feed, f.store, f.fetcher, f.decoder, f.extractor, f.pool);
    pipeline.start();
    assert(pipeline.running());
    for (int i = 0; i < 500 && f.count() == 0; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    pipeline.stop();
    assert(!pipeline.running());
    assert(f.count() == 1);
}

TEST(pipeline_background_run_ends_on_its_own) {
    Fixture f;
    f.host.serve(ref_for("a").url_big, solid_png(60, 60, Rgb(128, 0, 128)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("a")};

    IndexingPipeline pipeline(f.pipeline_config(false, false), feed, f.store, f.fetcher, f.decoder, f.extractor,
                              f.pool);
    pipeline.start();
    for (int i = 0; i < 500 && pipeline.running(); ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(!pipeline.running());
    assert(pipeline.stats().indexed == 1);
    assert(feed.requested == std::vector<int>({1, 2}));

    // A finished run can be started again.
    pipeline.start();
    pipeline.stop();
    assert(!pipeline.running());
}

struct ServiceFixture : Fixture {
    MemoryCounterStore counters;
    RateLimiter limiter{counters};
    ConcurrencyGate gate{2};
    PaletteService service;

    static PaletteService::Config service_config() {
        PaletteService::Config cfg;
        cfg.extraction_rule = {300, 3};
        cfg.search_rule = {60, 15};
        return cfg;
    }

    ServiceFixture() : service(service_config(), store, fetcher, decoder, extractor, pool, limiter, gate) {}
};

TEST(service_extract_from_bytes) {
    ServiceFixture f;
    ApiResponse r = f.service.extract_from_bytes("c1", make_png(100, 100, Rgb(255, 0, 0), Rgb(0, 0, 255)),
                                                 std::string("image/png"));
    assert(r.status == 200);
    assert(r.body.isArray());
    assert(r.body.size() == 2);
    const Json::Value& first = r.body[0];
    assert(first["lab"].size() == 3);
    assert(first["rgb"].size() == 3);
    assert(first["hex"].asString().size() == 6);
    assert(std::abs(first["percentage"].asDouble() - 0.5) < 0.01);
    assert(first["name"].isString());
    assert(first["name_distance"].isNumeric());
}

TEST(service_extract_validation_errors) {
    ServiceFixture f;
    ApiResponse r = f.service.extract_from_bytes("", solid_png(60, 60, Rgb(1, 1, 1)), std::string("image/gif"));
    assert(r.status == 400);
    assert(r.body["image"].asString() == "Only image/jpeg, image/png images are allowed.");

    r = f.service.extract_from_bytes("", solid_png(20, 60, Rgb(1, 1, 1)), std::nullopt);
    assert(r.status == 400);
    assert(r.body["image"].asString().find("Minimum allowed image size") == 0);

    r = f.service.extract_from_bytes("", std::vector<uint8_t>(100, 7), std::nullopt);
    assert(r.status == 400);
    assert(r.body["image"].asString() == "Invalid image format.");
}

TEST(service_extract_from_url) {
    ServiceFixture f;
    f.host.serve("https://cdn.example.com/x.png", solid_png(70, 70, Rgb(0, 200, 0)));
    ApiResponse r = f.service.extract_from_url("", "https://cdn.example.com/x.png");
    assert(r.status == 200);
    assert(r.body.size() == 1);

    r = f.service.extract_from_url("", "https://cdn.example.com/missing.png");
    assert(r.status == 400);
    assert(r.body["url"].asString() == "The requested resource is not available.");

    r = f.service.extract_from_url("", "file:///etc/passwd");
    assert(r.status == 400);
    assert(r.body.isMember("url"));
}

TEST(service_rate_limit_and_gate) {
    ServiceFixture f;
    std::vector<uint8_t> png = solid_png(60, 60, Rgb(9, 9, 9));
    for (int i = 0; i < 3; ++i) {
        assert(f.service.extract_from_bytes("c1", png, std::nullopt).status == 200);
    }
    ApiResponse limited = f.service.extract_from_bytes("c1", png, std::nullopt);
    assert(limited.status == 429);
    assert(limited.headers.count("Retry-After") == 1);
    assert(std::stoi(limited.headers["Retry-After"]) >= 1);
    assert(f.service.extract_from_bytes("c2", png, std::nullopt).status == 200);

    ConcurrencyGate::Permit a = f.gate.try_acquire();
    ConcurrencyGate::Permit b = f.gate.try_acquire();
    ApiResponse busy = f.service.extract_from_bytes("c3", png, std::nullopt);
    assert(busy.status == 503);
    a.release();
    assert(f.service.extract_from_bytes("c3", png, std::nullopt).status == 200);
    assert(f.gate.in_use() == 1);
}

TEST(service_search_and_detail) {
    ServiceFixture f;
    int64_t red = 0;
    int64_t blue = 0;
    std::vector<Color> red_colors = {Color::from_rgb(Rgb(255, 0, 0), 1.0)};
    f.namer.annotate(red_colors[0]);
    assert(f.store.replace(ref_for("red"), red_colors, red).success());
    assert(f.store.replace(ref_for("blue"), {Color::from_rgb(Rgb(0, 0, 255), 1.0)}, blue).success());

    ApiResponse r = f.service.search("", "ff0000", std::nullopt, 0);
    assert(r.status == 200);
    assert(r.body.size() == 2);
    assert(r.body[0]["id"].asInt64() == red);
    assert(r.body[0]["origin"].asString() == ref_for("red").origin);

    r = f.service.search("", "ff0000", 1, 1);
    assert(r.status == 200);
    assert(r.body.size() == 1);
    assert(r.body[0]["id"].asInt64() == blue);

    assert(f.service.search("", "FF0000", std::nullopt, 0).body.isMember("color"));
    assert(f.service.search("", "#ff0000", std::nullopt, 0).status == 400);
    assert(f.service.search("", "ff000", std::nullopt, 0).status == 400);
    assert(f.service.search("", "ff0000", 0, 0).body.isMember("limit"));
    assert(f.service.search("", "ff0000", 101, 0).status == 400);
    assert(f.service.search("", "ff0000", std::nullopt, -1).body.isMember("offset"));

    r = f.service.detail(red);
    assert(r.status == 200);
    assert(r.body["image"]["id"].asInt64() == red);
    assert(r.body["colors"].size() == 1);
    assert(r.body["colors"][0]["name"].asString() == "red");

    r = f.service.detail(red + blue + 100);
    assert(r.status == 404);
    assert(!r.to_json().empty());
}

TEST(service_search_rate_limit) {
    ServiceFixture f;
    for (int i = 0; i < 15; ++i) {
        assert(f.service.search("c9", "00ff00", std::nullopt, 0).status == 200);
    }
    assert(f.service.search("c9", "00ff00", std::nullopt, 0).status == 429);
    assert(f.service.search("", "00ff00", std::nullopt, 0).status == 200);
}

static ApiRequest api_request(const std::string& method, const std::string& path) {
    ApiRequest request;
    request.method = method;
    request.path = path;
    return request;
}

static ApiRequest upload_request(const std::vector<uint8_t>& bytes, const std::string& content_type) {
    ApiRequest request = api_request("PUT", "/image");
    request.body = bytes;
    if (!content_type.empty()) request.headers["content-type"] = content_type;
    return request;
}

static ApiRequest url_request(const std::string& json) {
    ApiRequest request = api_request("PUT", "/image");
    request.headers["content-type"] = "application/json; charset=utf-8";
    request.body.assign(json.begin(), json.end());
    return request;
}

TEST(router_routes_requests) {
    ServiceFixture f;
    ApiRouter router(ApiRouter::Config(), f.service);

    ApiResponse r = router.handle(api_request("GET", "/"));
    assert(r.status == 200);
    assert(r.body["status"].asString() == "OK");
    assert(r.headers["Access-Control-Allow-Origin"] == "*");

    r = router.handle(upload_request(solid_png(64, 64, Rgb(250, 120, 0)), "image/png"));
    assert(r.status == 200);
    assert(r.body.isArray() && r.body.size() == 1);

    r = router.handle(upload_request(solid_png(64, 64, Rgb(250, 120, 0)), ""));
    assert(r.status == 400);
    assert(r.body.isMember("image"));

    f.host.serve("https://cdn.example.com/u.png", solid_png(64, 64, Rgb(0, 0, 90)));
    r = router.handle(url_request("{\"url\": \"https://cdn.example.com/u.png\"}"));
    assert(r.status == 200);
    assert(r.body.size() == 1);

    r = router.handle(url_request("{\"link\": 1}"));
    assert(r.status == 400);
    assert(r.body.isMember("url"));
    r = router.handle(url_request("not json"));
    assert(r.status == 400);

    ApiRequest search = api_request("GET", "/images");
    search.query["color"] = "ff7800";
    r = router.handle(search);
    assert(r.status == 200);
    assert(r.body.isArray());

    search.query["limit"] = "ten";
    r = router.handle(search);
    assert(r.status == 400);
    assert(r.body.isMember("limit"));

    r = router.handle(api_request("GET", "/images"));
    assert(r.status == 400);
    assert(r.body.isMember("color"));

    r = router.handle(api_request("GET", "/images/12345"));
    assert(r.status == 404);
    r = router.handle(api_request("GET", "/images/abc"));
    assert(r.status == 404);

    r = router.handle(api_request("POST", "/image"));
    assert(r.status == 405);
    assert(r.headers["Allow"] == "PUT");

    r = router.handle(api_request("OPTIONS", "/image"));
    assert(r.status == 200);
    assert(r.headers.count("Access-Control-Allow-Methods") == 1);

    assert(router.handle(api_request("GET", "/nowhere")).status == 404);
}

TEST(router_limits_by_real_ip) {
    ServiceFixture f;
    ApiRouter::Config cfg;
    cfg.cors_allow_origin.clear();
    ApiRouter router(cfg, f.service);

    ApiRequest upload = upload_request(solid_png(60, 60, Rgb(5, 5, 5)), "image/png");
    upload.headers["x-real-ip"] = "10.0.0.1";
    for (int i = 0; i < 3; ++i) {
        assert(router.handle(upload).status == 200);
    }
    ApiResponse limited = router.handle(upload);
    assert(limited.status == 429);
    assert(limited.headers.count("Retry-After") == 1);
    assert(limited.headers.count("Access-Control-Allow-Origin") == 0);

    upload.headers["x-real-ip"] = "10.0.0.2";
    assert(router.handle(upload).status == 200);

    // Without the proxy header the request is not limited.
    upload.headers.erase("x-real-ip");
    for (int i = 0; i < 5; ++i) {
        assert(router.handle(upload).status == 200);
    }
}

TEST(requests_served_while_indexing) {
    ServiceFixture f;
    f.host.serve(ref_for("red").url_big, solid_png(60, 60, Rgb(250, 10, 10)));
    f.host.serve(ref_for("blue").url_big, solid_png(60, 60, Rgb(10, 10, 250)));

    FakeFeed feed;
    feed.pages[1] = {ref_for("red"), ref_for("blue")};

    IndexingPipeline::Config cfg = f.pipeline_config(true, false);
    cfg.periodicity_sec = 0.02;
    IndexingPipeline pipeline(cfg, feed, f.store, f.fetcher, f.decoder, f.extractor, f.pool);
    ApiRouter router(ApiRouter::Config(), f.service);

    pipeline.start();
    ApiRequest upload = upload_request(solid_png(64, 64, Rgb(0, 160, 0)), "image/png");
    for (int i = 0; i < 5; ++i) {
        assert(router.handle(upload).status == 200);
    }
    for (int i = 0; i < 500 && f.count() < 2; ++i) {
        std::this_thread::sleep_for(std::chrono::milliseconds(10));
    }
    assert(pipeline.running());

    ApiRequest search = api_request("GET", "/images");
    search.query["color"] = "0a0afa";
    ApiResponse r = router.handle(search);
    assert(r.status == 200);
    assert(r.body.size() == 2);
    assert(r.body[0]["origin"].asString() == ref_for("blue").origin);

    r = router.handle(api_request("GET", "/images/" + std::to_string(r.body[0]["id"].asInt64())));
    assert(r.status == 200);
    assert(r.body["colors"].size() == 1);

    pipeline.stop();
    assert(!pipeline.running());
    assert(f.count() == 2);
}

int main() {
    set_log_level(LogLevel::Off);
    ColorSpace::init();

    std::cout << "=== chromadex integration tests ===\n\n";

    std::cout << "--- Store Tests ---\n";
    RUN_TEST(store_round_trip);
    RUN_TEST(store_replace_drops_old_colors);
    RUN_TEST(store_search_orders_by_distance);

    std::cout << "\n--- Indexing Pipeline Tests ---\n";
    RUN_TEST(pipeline_non_cyclic_terminates);
    RUN_TEST(pipeline_bounded_range);
    RUN_TEST(pipeline_cyclic_loops_until_stopped);
    RUN_TEST(pipeline_retries_failed_page);
    RUN_TEST(pipeline_idempotence);
    RUN_TEST(pipeline_skips_bad_images);
    RUN_TEST(pipeline_background_start_stop);
    RUN_TEST(pipeline_background_run_ends_on_its_own);

    std::cout << "\n--- Service Tests ---\n";
    RUN_TEST(service_extract_from_bytes);
    RUN_TEST(service_extract_validation_errors);
    RUN_TEST(service_extract_from_url);
    RUN_TEST(service_rate_limit_and_gate);
    RUN_TEST(service_search_and_detail);
    RUN_TEST(service_search_rate_limit);

    std::cout << "\n--- HTTP Routing Tests ---\n";
    RUN_TEST(router_routes_requests);
    RUN_TEST(router_limits_by_real_ip);
    RUN_TEST(requests_served_while_indexing);

    std::cout << "\n=== Test Summary ===\n";
    std::cout << "Failures: " << failures << "\n";

    if (failures == 0) {
        std::cout << "\nAll tests passed!\n";
        return 0;
    } else {
        std::cout << "\nSome tests failed!\n";
        return 1;
    }
}
