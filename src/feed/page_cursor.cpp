#include "feed/page_cursor.hpp"

namespace chromadex {

PageCursor::PageCursor(const Config& config) : config_(config), page_(config.start_page) {
    if (bounded() && config_.start_page > config_.end_page) {
        exhausted_ = !config_.cyclic;
    }
}

std::optional<int> PageCursor::current() const {
    if (exhausted_) return std::nullopt;
    return page_;
}

void PageCursor::wrap() {
    page_ = config_.start_page;
    ++wraps_;
}

void PageCursor::advance() {
    if (exhausted_) return;
    ++page_;
    if (bounded() && page_ > config_.end_page) {
        if (config_.cyclic) {
            wrap();
        } else {
            exhausted_ = true;
        }
    }
}

bool PageCursor::on_empty_page() {
    if (exhausted_) return false;
    if (config_.cyclic) {
        wrap();
        return true;
    }
    exhausted_ = true;
    return false;
}

}
