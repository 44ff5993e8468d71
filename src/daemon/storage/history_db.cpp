#include "history_db.hpp"

#include <filesystem>
#include <print>

namespace fs = std::filesystem;

HistoryDb::HistoryDb() = default;

HistoryDb::~HistoryDb() {
    close();
}

bool HistoryDb::open(const std::string& path) {
    // Ensure parent directory exists
    fs::path p(path);
    std::error_code ec;
    if (p.has_parent_path()) {
        fs::create_directories(p.parent_path(), ec);
    }

    int rc = sqlite3_open(path.c_str(), &db_);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: failed to open {}: {}", path, sqlite3_errmsg(db_));
        sqlite3_close(db_);
        db_ = nullptr;
        return false;
    }

    // Enable WAL mode for better concurrent access
    sqlite3_exec(db_, "PRAGMA journal_mode=WAL;", nullptr, nullptr, nullptr);

    if (!create_tables()) {
        close();
        return false;
    }

    const char* columns =
        "id, created_at, filename, model_used, transcription, reference_text, duration, diff";

    bool ok =
        prepare("INSERT INTO transcriptions (filename, model_used, transcription, "
                "reference_text, duration, diff) VALUES (?, ?, ?, ?, ?, ?)", &insert_stmt_) &&
        prepare((std::string("SELECT ") + columns +
                 " FROM transcriptions ORDER BY id DESC LIMIT ? OFFSET ?").c_str(), &recent_stmt_) &&
        prepare("SELECT COUNT(*) FROM transcriptions", &count_stmt_) &&
        prepare((std::string("SELECT ") + columns +
                 " FROM transcriptions WHERE id = ?").c_str(), &get_stmt_) &&
        prepare("DELETE FROM transcriptions WHERE id = ?", &delete_stmt_);

    if (!ok) {
        close();
        return false;
    }
    return true;
}

void HistoryDb::close() {
    for (auto** stmt : {&insert_stmt_, &recent_stmt_, &count_stmt_, &get_stmt_, &delete_stmt_}) {
        if (*stmt) { sqlite3_finalize(*stmt); *stmt = nullptr; }
    }
    if (db_) { sqlite3_close(db_); db_ = nullptr; }
}

bool HistoryDb::prepare(const char* sql, sqlite3_stmt** stmt) {
    if (sqlite3_prepare_v2(db_, sql, -1, stmt, nullptr) != SQLITE_OK) {
        std::println(stderr, "db: prepare failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return true;
}

std::optional<int64_t> HistoryDb::insert(const HistoryEntry& e) {
    if (!insert_stmt_) return std::nullopt;

    sqlite3_reset(insert_stmt_);
    sqlite3_clear_bindings(insert_stmt_);

    auto bind_nullable = [this](int idx, const std::optional<std::string>& val) {
        if (!val) sqlite3_bind_null(insert_stmt_, idx);
        else sqlite3_bind_text(insert_stmt_, idx, val->c_str(), -1, SQLITE_TRANSIENT);
    };

    sqlite3_bind_text(insert_stmt_, 1, e.filename.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 2, e.model_used.c_str(), -1, SQLITE_TRANSIENT);
    sqlite3_bind_text(insert_stmt_, 3, e.transcription.c_str(), -1, SQLITE_TRANSIENT);
    bind_nullable(4, e.reference_text);
    sqlite3_bind_double(insert_stmt_, 5, e.duration);
    bind_nullable(6, e.diff_json);

    int rc = sqlite3_step(insert_stmt_);
    if (rc != SQLITE_DONE) {
        std::println(stderr, "db: insert failed: {}", sqlite3_errmsg(db_));
        return std::nullopt;
    }
    return sqlite3_last_insert_rowid(db_);
}

HistoryEntry HistoryDb::read_row(sqlite3_stmt* stmt) {
    auto get_text = [stmt](int col) -> std::string {
        auto* p = sqlite3_column_text(stmt, col);
        return p ? reinterpret_cast<const char*>(p) : "";
    };
    auto get_nullable = [stmt, &get_text](int col) -> std::optional<std::string> {
        if (sqlite3_column_type(stmt, col) == SQLITE_NULL) return std::nullopt;
        return get_text(col);
    };

    HistoryEntry e;
    e.id = sqlite3_column_int64(stmt, 0);
    e.created_at = get_text(1);
    e.filename = get_text(2);
    e.model_used = get_text(3);
    e.transcription = get_text(4);
    e.reference_text = get_nullable(5);
    e.duration = sqlite3_column_double(stmt, 6);
    e.diff_json = get_nullable(7);
    return e;
}

std::vector<HistoryEntry> HistoryDb::recent(int limit, int offset) {
    std::vector<HistoryEntry> entries;
    if (!recent_stmt_) return entries;

    sqlite3_reset(recent_stmt_);
    sqlite3_bind_int(recent_stmt_, 1, limit);
    sqlite3_bind_int(recent_stmt_, 2, offset);

    while (sqlite3_step(recent_stmt_) == SQLITE_ROW) {
        entries.push_back(read_row(recent_stmt_));
    }
    return entries;
}

int64_t HistoryDb::count() {
    if (!count_stmt_) return 0;

    sqlite3_reset(count_stmt_);
    int64_t n = 0;
    if (sqlite3_step(count_stmt_) == SQLITE_ROW) n = sqlite3_column_int64(count_stmt_, 0);
    sqlite3_reset(count_stmt_);
    return n;
}

std::optional<HistoryEntry> HistoryDb::get(int64_t id) {
    if (!get_stmt_) return std::nullopt;

    sqlite3_reset(get_stmt_);
    sqlite3_bind_int64(get_stmt_, 1, id);
    std::optional<HistoryEntry> entry;
    if (sqlite3_step(get_stmt_) == SQLITE_ROW) entry = read_row(get_stmt_);
    // Release the read cursor before any later write
    sqlite3_reset(get_stmt_);
    return entry;
}

bool HistoryDb::remove(int64_t id) {
    if (!delete_stmt_) return false;

    sqlite3_reset(delete_stmt_);
    sqlite3_bind_int64(delete_stmt_, 1, id);
    if (sqlite3_step(delete_stmt_) != SQLITE_DONE) {
        std::println(stderr, "db: delete failed: {}", sqlite3_errmsg(db_));
        return false;
    }
    return sqlite3_changes(db_) > 0;
}

int64_t HistoryDb::clear() {
    if (!db_) return 0;

    char* err = nullptr;
    if (sqlite3_exec(db_, "DELETE FROM transcriptions", nullptr, nullptr, &err) != SQLITE_OK) {
        std::println(stderr, "db: clear failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return 0;
    }
    return sqlite3_changes(db_);
}

bool HistoryDb::create_tables() {
    const char* sql = R"(
        CREATE TABLE IF NOT EXISTS transcriptions (
            id INTEGER PRIMARY KEY AUTOINCREMENT,
            created_at TEXT NOT NULL DEFAULT (strftime('%Y-%m-%dT%H:%M:%f','now')),
            filename TEXT NOT NULL,
            model_used TEXT NOT NULL,
            transcription TEXT NOT NULL,
            reference_text TEXT,
            duration REAL,
            diff TEXT
        );
    )";

    char* err = nullptr;
    int rc = sqlite3_exec(db_, sql, nullptr, nullptr, &err);
    if (rc != SQLITE_OK) {
        std::println(stderr, "db: create table failed: {}", err ? err : "unknown");
        sqlite3_free(err);
        return false;
    }
    return true;
}
