#pragma once

#include <optional>

namespace chromadex {

// Page numbering for one indexing run: a bounded range or an unbounded
// sequence, either of which may repeat.
class PageCursor {
public:
    struct Config {
        int start_page = 1;
        // 0 means unbounded.
        int end_page = 0;
        bool cyclic = false;
    };

    PageCursor() : PageCursor(Config()) {}
    explicit PageCursor(const Config& config);

    // Page to fetch next, or nullopt once a non-cyclic cursor is exhausted.
    std::optional<int> current() const;

    // Moves past a page that returned images.
    void advance();

    // Handles a page that came back empty. Returns false when the run ends.
    bool on_empty_page();

    bool exhausted() const { return exhausted_; }
    bool bounded() const { return config_.end_page > 0; }
    bool cyclic() const { return config_.cyclic; }
    int wraps() const { return wraps_; }

private:
    Config config_;
    int page_;
    int wraps_ = 0;
    bool exhausted_ = false;

    void wrap();
};

}
