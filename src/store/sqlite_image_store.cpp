#include "store/sqlite_image_store.hpp"
#include "core/log.hpp"
#include <sqlite3.h>
#include <stdexcept>

namespace chromadex {

namespace {

const char* const SCHEMA_SQL =
    "PRAGMA foreign_keys = ON;"
    "CREATE TABLE IF NOT EXISTS image ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  origin TEXT NOT NULL UNIQUE,"
    "  url_big TEXT NOT NULL,"
    "  url_thumb TEXT NOT NULL,"
    "  indexed_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%fZ', 'now'))"
    ");"
    "CREATE TABLE IF NOT EXISTS image_color ("
    "  id INTEGER PRIMARY KEY AUTOINCREMENT,"
    "  image_id INTEGER NOT NULL REFERENCES image(id) ON DELETE CASCADE,"
    "  lab_l REAL NOT NULL,"
    "  lab_a REAL NOT NULL,"
    "  lab_b REAL NOT NULL,"
    "  percentage REAL NOT NULL,"
    "  name TEXT,"
    "  name_distance REAL"
    ");"
    "CREATE INDEX IF NOT EXISTS image_color_image_id ON image_color(image_id);";

// Minimum over an image's colors of the normalized Lab distance plus a
// penalty for colors that cover little of the image. The square root is
// omitted since it does not change the ordering.
const char* const SEARCH_SQL =
    "SELECT i.id, i.origin, i.url_big, i.url_thumb,"
    "  MIN((c.lab_l / 100.0 - ?1) * (c.lab_l / 100.0 - ?1) +"
    "      ((c.lab_a + 128.0) / 256.0 - ?2) * ((c.lab_a + 128.0) / 256.0 - ?2) +"
    "      ((c.lab_b + 128.0) / 256.0 - ?3) * ((c.lab_b + 128.0) / 256.0 - ?3) +"
    "      ?4 * (c.percentage - 1.0) * (c.percentage - 1.0)) AS distance "
    "FROM image_color AS c JOIN image AS i ON c.image_id = i.id "
    "GROUP BY i.id "
    "ORDER BY distance, i.id "
    "LIMIT ?5 OFFSET ?6";

class Statement {
public:
    Statement() = default;
    ~Statement() {
        if (stmt_) sqlite3_finalize(stmt_);
    }
    Statement(const Statement&) = delete;
    Statement& operator=(const Statement&) = delete;

    sqlite3_stmt** out() { return &stmt_; }
    sqlite3_stmt* get() const { return stmt_; }

private:
    sqlite3_stmt* stmt_ = nullptr;
};

std::string column_text(sqlite3_stmt* stmt, int col) {
    const unsigned char* text = sqlite3_column_text(stmt, col);
    return text ? reinterpret_cast<const char*>(text) : std::string();
}

void bind_text(sqlite3_stmt* stmt, int index, const std::string& value) {
    sqlite3_bind_text(stmt, index, value.c_str(), static_cast<int>(value.size()), SQLITE_TRANSIENT);
}

}

SqliteImageStore::SqliteImageStore(const Config& config) : config_(config) {
    const int flags = SQLITE_OPEN_READWRITE | SQLITE_OPEN_CREATE | SQLITE_OPEN_FULLMUTEX;
    if (sqlite3_open_v2(config_.path.c_str(), &db_, flags, nullptr) != SQLITE_OK) {
        std::string msg = db_ ? sqlite3_errmsg(db_) : "out of memory";
        if (db_) {
            sqlite3_close(db_);
            db_ = nullptr;
        }
        throw std::runtime_error("cannot open database " + config_.path + ": " + msg);
    }
    sqlite3_busy_timeout(db_, config_.busy_timeout_ms);

    Result result = exec(SCHEMA_SQL);
    if (result.failure()) {
        sqlite3_close(db_);
        db_ = nullptr;
        throw std::runtime_error("cannot create schema in " + config_.path + ": " + result.message);
    }
}

SqliteImageStore::~SqliteImageStore() {
    if (db_) {
        sqlite3_close(db_);
    }
}

Result SqliteImageStore::error(const std::string& context) const {
    return Result::fail(ErrorCode::STORAGE_ERROR, context + ": " + sqlite3_errmsg(db_));
}

Result SqliteImageStore::exec(const char* sql) {
    char* errmsg = nullptr;
    if (sqlite3_exec(db_, sql, nullptr, nullptr, &errmsg) != SQLITE_OK) {
        std::string msg = errmsg ? errmsg : "unknown error";
        sqlite3_free(errmsg);
        return Result::fail(ErrorCode::STORAGE_ERROR, msg);
    }
    return Result::ok();
}

Result SqliteImageStore::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        return error("prepare failed");
    }
    return Result::ok();
}

Result SqliteImageStore::exists(const std::string& origin, bool& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt;
    Result result = prepare("SELECT 1 FROM image WHERE origin = ?1", stmt.out());
    if (result.failure()) return result;

    bind_text(stmt.get(), 1, origin);
    int rc = sqlite3_step(stmt.get());
    if (rc != SQLITE_ROW && rc != SQLITE_DONE) {
        return error("exists failed");
    }
    out = rc == SQLITE_ROW;
    return Result::ok();
}

Result SqliteImageStore::replace_locked(const ImageRef& ref, const std::vector<Color>& colors, int64_t& id) {
    {
        Statement del;
        Result result = prepare("DELETE FROM image WHERE origin = ?1", del.out());
        if (result.failure()) return result;
        bind_text(del.get(), 1, ref.origin);
        if (sqlite3_step(del.get()) != SQLITE_DONE) return error("delete image failed");
    }

    {
        Statement ins;
        Result result = prepare("INSERT INTO image (origin, url_big, url_thumb) VALUES (?1, ?2, ?3)", ins.out());
        if (result.failure()) return result;
        bind_text(ins.get(), 1, ref.origin);
        bind_text(ins.get(), 2, ref.url_big);
        bind_text(ins.get(), 3, ref.url_thumb);
        if (sqlite3_step(ins.get()) != SQLITE_DONE) return error("insert image failed");
        id = sqlite3_last_insert_rowid(db_);
    }

    Statement ins;
    Result result = prepare(
        "INSERT INTO image_color (image_id, lab_l, lab_a, lab_b, percentage, name, name_distance) "
        "VALUES (?1, ?2, ?3, ?4, ?5, ?6, ?7)",
        ins.out());
    if (result.failure()) return result;

    for (const auto& color : colors) {
        sqlite3_reset(ins.get());
        sqlite3_clear_bindings(ins.get());
        sqlite3_bind_int64(ins.get(), 1, id);
        sqlite3_bind_double(ins.get(), 2, color.L());
        sqlite3_bind_double(ins.get(), 3, color.a());
        sqlite3_bind_double(ins.get(), 4, color.b());
        sqlite3_bind_double(ins.get(), 5, color.percentage());
        if (color.name()) {
            bind_text(ins.get(), 6, *color.name());
        } else {
            sqlite3_bind_null(ins.get(), 6);
        }
        if (color.name_distance()) {
            sqlite3_bind_double(ins.get(), 7, *color.name_distance());
        } else {
            sqlite3_bind_null(ins.get(), 7);
        }
        if (sqlite3_step(ins.get()) != SQLITE_DONE) return error("insert color failed");
    }
    return Result::ok();
}

Result SqliteImageStore::replace(const ImageRef& ref, const std::vector<Color>& colors, int64_t& id) {
    std::lock_guard<std::mutex> lock(mutex_);

    Result result = exec("BEGIN IMMEDIATE");
    if (result.failure()) return result;

    int64_t new_id = 0;
    result = replace_locked(ref, colors, new_id);
    if (result.failure()) {
        Result rollback = exec("ROLLBACK");
        if (rollback.failure()) {
            log_error("rollback failed: " + rollback.message);
        }
        return result;
    }

    result = exec("COMMIT");
    if (result.failure()) {
        Result rollback = exec("ROLLBACK");
        if (rollback.failure()) {
            log_error("rollback failed: " + rollback.message);
        }
        return result;
    }
    id = new_id;
    return Result::ok();
}

Result SqliteImageStore::get(int64_t id, std::optional<ImageRef>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt;
    Result result = prepare("SELECT id, origin, url_big, url_thumb FROM image WHERE id = ?1", stmt.out());
    if (result.failure()) return result;

    sqlite3_bind_int64(stmt.get(), 1, id);
    int rc = sqlite3_step(stmt.get());
    if (rc == SQLITE_DONE) {
        out.reset();
        return Result::ok();
    }
    if (rc != SQLITE_ROW) return error("get image failed");

    ImageRef ref(column_text(stmt.get(), 1), column_text(stmt.get(), 2), column_text(stmt.get(), 3));
    ref.id = sqlite3_column_int64(stmt.get(), 0);
    out = std::move(ref);
    return Result::ok();
}

Result SqliteImageStore::get_colors(int64_t id, std::vector<Color>& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt;
    Result result = prepare(
        "SELECT lab_l, lab_a, lab_b, percentage, name, name_distance FROM image_color "
        "WHERE image_id = ?1 ORDER BY percentage DESC, id",
        stmt.out());
    if (result.failure()) return result;

    sqlite3_bind_int64(stmt.get(), 1, id);
    std::vector<Color> colors;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        Color color(sqlite3_column_double(stmt.get(), 0), sqlite3_column_double(stmt.get(), 1),
                    sqlite3_column_double(stmt.get(), 2), sqlite3_column_double(stmt.get(), 3));
        if (sqlite3_column_type(stmt.get(), 4) != SQLITE_NULL) {
            double distance = sqlite3_column_type(stmt.get(), 5) != SQLITE_NULL
                                  ? sqlite3_column_double(stmt.get(), 5)
                                  : 0.0;
            color.set_name(column_text(stmt.get(), 4), distance);
        }
        colors.push_back(std::move(color));
    }
    if (rc != SQLITE_DONE) return error("get colors failed");

    out = std::move(colors);
    return Result::ok();
}

Result SqliteImageStore::search_by_color(const Color& query, int limit, int offset, std::vector<ImageRef>& out) {
    if (limit < 0 || offset < 0) {
        return Result::fail(ErrorCode::INVALID_ARGUMENT, "limit and offset must be non-negative", "offset");
    }

    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt;
    Result result = prepare(SEARCH_SQL, stmt.out());
    if (result.failure()) return result;

    sqlite3_bind_double(stmt.get(), 1, query.L() / 100.0);
    sqlite3_bind_double(stmt.get(), 2, (query.a() + 128.0) / 256.0);
    sqlite3_bind_double(stmt.get(), 3, (query.b() + 128.0) / 256.0);
    sqlite3_bind_double(stmt.get(), 4, config_.percentage_weight);
    sqlite3_bind_int(stmt.get(), 5, limit);
    sqlite3_bind_int(stmt.get(), 6, offset);

    std::vector<ImageRef> refs;
    int rc;
    while ((rc = sqlite3_step(stmt.get())) == SQLITE_ROW) {
        ImageRef ref(column_text(stmt.get(), 1), column_text(stmt.get(), 2), column_text(stmt.get(), 3));
        ref.id = sqlite3_column_int64(stmt.get(), 0);
        refs.push_back(std::move(ref));
    }
    if (rc != SQLITE_DONE) return error("search failed");

    out = std::move(refs);
    return Result::ok();
}

Result SqliteImageStore::count(int64_t& out) {
    std::lock_guard<std::mutex> lock(mutex_);
    Statement stmt;
    Result result = prepare("SELECT COUNT(*) FROM image", stmt.out());
    if (result.failure()) return result;

    if (sqlite3_step(stmt.get()) != SQLITE_ROW) return error("count failed");
    out = sqlite3_column_int64(stmt.get(), 0);
    return Result::ok();
}

}
