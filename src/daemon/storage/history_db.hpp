#pragma once

#include <cstdint>
#include <mutex>
#include <sqlite3.h>
#include <string>
#include <vector>

struct HistoryEntry {
    int64_t id = 0;
    std::string timestamp;
    std::string action;      // "staged-text" or "staged-image"
    std::string kind;        // artifact extension
    std::string content_hash;
    int64_t byte_size = 0;
    std::string staged_path;
    std::string alias_path;
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

    // id and timestamp of `entry` are ignored and assigned by the database.
    bool insert(const HistoryEntry& entry);

    std::vector<HistoryEntry> recent(int limit = 10);

private:
    bool create_tables();

    // insert() runs on the processor thread, recent() on the main thread
    std::mutex mutex_;
    sqlite3* db_ = nullptr;
    sqlite3_stmt* insert_stmt_ = nullptr;
    sqlite3_stmt* recent_stmt_ = nullptr;
};
