#pragma once

#include <cstdint>
#include <optional>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string created_at;
    std::string filename;
    std::string model_used;
    std::string transcription;
    std::optional<std::string> reference_text;
    double duration = 0.0;
    std::optional<std::string> diff_json; // serialized DiffSegment list
};

class HistoryDb {
public:
    HistoryDb();
    ~HistoryDb();

    HistoryDb(const HistoryDb&) = delete;
    HistoryDb& operator=(const HistoryDb&) = delete;

    bool open(const std::string& path);
    void close();
    bool is_open() const { return db_ != nullptr; }

    // Returns the new row id. created_at and id on the argument are ignored.
    std::optional<int64_t> insert(const HistoryEntry& entry);

    // Newest first.
    std::vector<HistoryEntry> recent(int limit = 20, int offset = 0);
    int64_t count();
    std::optional<HistoryEntry> get(int64_t id);
    bool remove(int64_t id);
    int64_t clear();

private:
    bool create_tables();
    bool prepare(const char* sql, sqlite3_stmt** stmt);
    HistoryEntry read_row(sqlite3_stmt* stmt);

    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
    sqlite3_stmt* count_stmt_ = nullptr;
    sqlite3_stmt* get_stmt_ = nullptr;
    sqlite3_stmt* delete_stmt_ = nullptr;
};
