#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/store.h — Persistence for the entry list
// ═══════════════════════════════════════════════════════════════════
//
//  An EntryStore is an insertion-ordered, append-only list of
//  entries. load() returns the whole list; append() adds one entry
//  atomically. Uniqueness policy lives in the Registry.
//
//    MemoryStore    process-local vector
//    JsonFileStore  pretty-printed JSON array in one file
//    SqliteStore    `entries` table with UNIQUE url and code
//
// ═══════════════════════════════════════════════════════════════════

#include "database.h"
#include "entry.h"
#include <memory>
#include <mutex>
#include <stdexcept>
#include <string>
#include <vector>

namespace shorturl::store {

// Unreadable, unwritable or corrupt persisted data
class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

class EntryStore {
public:
    virtual ~EntryStore() = default;

    virtual std::vector<Entry> load() const = 0;
    virtual void append(const Entry& entry) = 0;

    // "kind:location", for logs
    virtual std::string describe() const = 0;
};

class MemoryStore : public EntryStore {
public:
    MemoryStore() = default;
    explicit MemoryStore(std::vector<Entry> seed) : entries_(std::move(seed)) {}

    std::vector<Entry> load() const override;
    void append(const Entry& entry) override;
    std::string describe() const override { return "memory"; }

private:
    mutable std::mutex mutex_;
    std::vector<Entry> entries_;
};

// Creates the file (and parent directories) holding "[]" if missing.
// An empty file reads as no entries; anything else that is not a
// JSON array of entries is a StoreError.
class JsonFileStore : public EntryStore {
public:
    explicit JsonFileStore(std::string path);

    std::vector<Entry> load() const override;
    void append(const Entry& entry) override;
    std::string describe() const override { return "json:" + path_; }

    const std::string& path() const { return path_; }

private:
    std::vector<Entry> read() const;
    void write(const std::vector<Entry>& entries) const;

    std::string path_;
    mutable std::mutex mutex_;
};

class SqliteStore : public EntryStore {
public:
    explicit SqliteStore(const std::string& path);

    std::vector<Entry> load() const override;
    void append(const Entry& entry) override;
    std::string describe() const override { return "sqlite:" + path_; }

private:
    std::string path_;
    mutable db::Database db_;
};

// kind is "memory", "json" or "sqlite"
std::unique_ptr<EntryStore> open(const std::string& kind, const std::string& path);

} // namespace shorturl::store
