// ═══════════════════════════════════════════════════════════════════
//  registry.cpp — Duplicate suppression and code minting
// ═══════════════════════════════════════════════════════════════════

#include "shorturl/registry.h"
#include "shorturl/console.h"

#include <algorithm>
#include <unordered_set>

namespace shorturl::registry {

CodeDraw uniformDraw(std::uint64_t seed) {
    return [engine = std::mt19937_64(seed)](std::int64_t upper) mutable {
        std::uniform_int_distribution<std::int64_t> dist(1, upper);
        return dist(engine);
    };
}

Registry::Registry(store::EntryStore& store)
    : Registry(store, uniformDraw(std::random_device{}()))
{}

Registry::Registry(store::EntryStore& store, CodeDraw draw)
    : store_(store)
    , draw_(std::move(draw))
{}

std::int64_t Registry::codeRange(std::size_t count) {
    return std::max<std::int64_t>(kCodesPerEntry,
                                  static_cast<std::int64_t>(count) * kCodesPerEntry);
}

// Check and append form one critical section
Registration Registry::shorten(const std::string& normalizedUrl) {
    std::lock_guard<std::mutex> lock(writeMutex_);

    auto existing = store_.load();
    auto it = std::find_if(existing.begin(), existing.end(),
        [&](const Entry& e) { return e.original_url == normalizedUrl; });
    if (it != existing.end()) {
        return {*it, false};
    }

    Entry entry{normalizedUrl, generateCode(existing)};
    store_.append(entry);
    console::debug("registered", entry.short_url, "->", entry.original_url);
    return {entry, true};
}

std::optional<Entry> Registry::lookup(std::int64_t code) const {
    auto existing = store_.load();
    auto it = std::find_if(existing.begin(), existing.end(),
        [code](const Entry& e) { return e.short_url == code; });
    if (it == existing.end()) return std::nullopt;
    return *it;
}

std::vector<Entry> Registry::entries() const {
    return store_.load();
}

std::int64_t Registry::generateCode(const std::vector<Entry>& existing) {
    std::unordered_set<std::int64_t> taken;
    taken.reserve(existing.size());
    for (auto& e : existing) taken.insert(e.short_url);

    const auto upper = codeRange(existing.size());
    for (int attempt = 0; attempt < kMaxAttempts; ++attempt) {
        auto candidate = draw_(upper);
        if (taken.count(candidate) == 0) return candidate;
    }

    throw CodeSpaceExhausted("no free short code after " + std::to_string(kMaxAttempts) +
                             " attempts in [1, " + std::to_string(upper) + "]");
}

} // namespace shorturl::registry
