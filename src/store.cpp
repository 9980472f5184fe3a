// ═══════════════════════════════════════════════════════════════════
//  store.cpp — MemoryStore, JsonFileStore, SqliteStore
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/store.h"
#include "shorturl/fs.h"

#include <nlohmann/json.hpp>

namespace shorturl::store {

// ── MemoryStore ──

std::vector<Entry> MemoryStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return entries_;
}

void MemoryStore::append(const Entry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    entries_.push_back(entry);
}

// ── JsonFileStore ──

JsonFileStore::JsonFileStore(std::string path)
    : path_(std::move(path)) {
    try {
        if (!fs::existsSync(path_)) {
            fs::ensureParentDir(path_);
            fs::writeFileSync(path_, "[]");
        }
    } catch (const std::exception& e) {
        throw StoreError("cannot create " + path_ + ": " + e.what());
    }
}

std::vector<Entry> JsonFileStore::load() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return read();
}

// Read, append and replace happen under one lock
void JsonFileStore::append(const Entry& entry) {
    std::lock_guard<std::mutex> lock(mutex_);
    auto entries = read();
    entries.push_back(entry);
    write(entries);
}

std::vector<Entry> JsonFileStore::read() const {
    std::string raw;
    try {
        raw = fs::readFileSync(path_);
    } catch (const std::exception& e) {
        throw StoreError(e.what());
    }
    if (raw.empty()) return {};

    try {
        auto doc = nlohmann::json::parse(raw);
        if (!doc.is_array()) {
            throw StoreError(path_ + ": expected a JSON array");
        }
        return doc.get<std::vector<Entry>>();
    } catch (const nlohmann::json::exception& e) {
        throw StoreError(path_ + ": corrupt data: " + e.what());
    }
}

void JsonFileStore::write(const std::vector<Entry>& entries) const {
    try {
        fs::writeFileAtomicSync(path_, nlohmann::json(entries).dump(2));
    } catch (const std::exception& e) {
        throw StoreError(e.what());
    }
}

// ── SqliteStore ──

namespace {

db::Database openDatabase(const std::string& path) {
    try {
        if (path != ":memory:") fs::ensureParentDir(path);
        db::Database db(path);
        db.execMulti(
            "CREATE TABLE IF NOT EXISTS entries ("
            "  seq          INTEGER PRIMARY KEY AUTOINCREMENT,"
            "  original_url TEXT    NOT NULL UNIQUE,"
            "  short_url    INTEGER NOT NULL UNIQUE"
            ");"
        );
        return db;
    } catch (const std::exception& e) {
        throw StoreError("cannot open " + path + ": " + e.what());
    }
}

} // namespace

SqliteStore::SqliteStore(const std::string& path)
    : path_(path)
    , db_(openDatabase(path))
{}

std::vector<Entry> SqliteStore::load() const {
    std::vector<Entry> entries;
    try {
        auto result = db::query(db_).table("entries")
            .select("original_url, short_url")
            .orderBy("seq")
            .run();
        entries.reserve(result.size());
        for (auto& row : result.rows) {
            entries.push_back(Entry{row.at("original_url"), std::stoll(row.at("short_url"))});
        }
    } catch (const db::Error& e) {
        throw StoreError(e.what());
    } catch (const std::logic_error& e) {
        throw StoreError(path_ + ": corrupt row: " + e.what());
    }
    return entries;
}

void SqliteStore::append(const Entry& entry) {
    try {
        db::query(db_).table("entries").insert({
            {"original_url", entry.original_url},
            {"short_url", std::to_string(entry.short_url)},
        }).run();
    } catch (const db::ConstraintError& e) {
        throw StoreError("duplicate entry rejected: " + std::string(e.what()));
    } catch (const db::Error& e) {
        throw StoreError(e.what());
    }
}

// ── factory ──

std::unique_ptr<EntryStore> open(const std::string& kind, const std::string& path) {
    if (kind == "memory") return std::make_unique<MemoryStore>();
    if (kind == "json")   return std::make_unique<JsonFileStore>(path);
    if (kind == "sqlite") return std::make_unique<SqliteStore>(path);
    throw StoreError("unknown store kind '" + kind + "'");
}

} // namespace shorturl::store
