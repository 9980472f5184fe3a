#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/registry.h — URL <-> short code registry
// ═══════════════════════════════════════════════════════════════════
//
//    store::MemoryStore store;
//    registry::Registry urls(store);
//    auto r = urls.shorten("https://example.com");   // r.created == true
//    auto e = urls.lookup(r.entry.short_url);        // -> same entry
//
//  The registry keeps no cache: every call reloads the store.
// ═══════════════════════════════════════════════════════════════════

#include "entry.h"
#include "store.h"
#include <cstdint>
#include <functional>
#include <mutex>
#include <optional>
#include <random>
#include <stdexcept>
#include <vector>

namespace shorturl::registry {

// Random draws kept colliding; the code range is too dense
class CodeSpaceExhausted : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

struct Registration {
    Entry entry;
    bool created = false;   // false when the URL was already registered
};

// Returns a candidate code in [1, upper]
using CodeDraw = std::function<std::int64_t(std::int64_t upper)>;

// Uniform draws from a 64-bit Mersenne Twister
CodeDraw uniformDraw(std::uint64_t seed);

class Registry {
public:
    static constexpr int kMaxAttempts = 100;
    static constexpr std::int64_t kCodesPerEntry = 1000;

    explicit Registry(store::EntryStore& store);
    Registry(store::EntryStore& store, CodeDraw draw);

    Registry(const Registry&) = delete;
    Registry& operator=(const Registry&) = delete;

    // Returns the existing entry for `normalizedUrl`, or mints a code
    // and appends a new one. Throws CodeSpaceExhausted, StoreError.
    Registration shorten(const std::string& normalizedUrl);

    std::optional<Entry> lookup(std::int64_t code) const;

    std::vector<Entry> entries() const;

    // Upper end of the draw range for a table of `count` entries
    static std::int64_t codeRange(std::size_t count);

private:
    std::int64_t generateCode(const std::vector<Entry>& existing);

    store::EntryStore& store_;
    std::mutex writeMutex_;
    CodeDraw draw_;             // only called under writeMutex_
};

} // namespace shorturl::registry
