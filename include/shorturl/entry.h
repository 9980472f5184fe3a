#pragma once
// ═══════════════════════════════════════════════════════════════════
//  shorturl/entry.h — The persisted URL <-> code record
// ═══════════════════════════════════════════════════════════════════

#include "json_utils.h"
#include <cstdint>
#include <string>

namespace shorturl {

// Field names are the persisted and wire names.
struct Entry {
    std::string original_url;
    std::int64_t short_url = 0;

    bool operator==(const Entry&) const = default;

    SHORTURL_SERIALIZE(Entry, original_url, short_url)
};

} // namespace shorturl
