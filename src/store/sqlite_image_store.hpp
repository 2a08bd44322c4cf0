#pragma once

#include "store/image_store.hpp"
#include <mutex>
#include <string>

struct sqlite3;
struct sqlite3_stmt;

namespace chromadex {

// ImageStore over a single SQLite connection. Calls are serialized.
class SqliteImageStore : public ImageStore {
public:
    struct Config {
        std::string path = "chromadex.db";
        double percentage_weight = 0.2;
        int busy_timeout_ms = 5000;
    };

    // Opens (creating if needed) the database and its schema. Throws
    // std::runtime_error when the database cannot be opened.
    explicit SqliteImageStore(const Config& config);
    ~SqliteImageStore() override;

    SqliteImageStore(const SqliteImageStore&) = delete;
    SqliteImageStore& operator=(const SqliteImageStore&) = delete;

    Result exists(const std::string& origin, bool& out) override;
    Result replace(const ImageRef& ref, const std::vector<Color>& colors, int64_t& id) override;
    Result get(int64_t id, std::optional<ImageRef>& out) override;
    Result get_colors(int64_t id, std::vector<Color>& out) override;
    Result search_by_color(const Color& query, int limit, int offset, std::vector<ImageRef>& out) override;
    Result count(int64_t& out) override;

    const std::string& path() const { return config_.path; }

private:
    Config config_;
    sqlite3* db_ = nullptr;
    std::mutex mutex_;

    Result exec(const char* sql);
    Result prepare(const char* sql, sqlite3_stmt** stmt);
    Result error(const std::string& context) const;
    Result replace_locked(const ImageRef& ref, const std::vector<Color>& colors, int64_t& id);
};

}
