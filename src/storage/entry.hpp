#pragma once

#include <cstdint>
#include <functional>
#include <map>
#include <optional>
#include <string>

#include <nlohmann/json.hpp>

namespace ttlkv {

// Any JSON-representable payload: null, bool, number, string, array, object.
using Value = nlohmann::json;

// ── Entry ────────────────────────────────────────────────────────────────────
//
// A stored value plus its optional expiration instant (epoch seconds).
// No expiration means the entry lives until removed.

struct Entry {
    Value value;
    std::optional<int64_t> expiration;

    bool operator==(const Entry&) const = default;
};

// Keyed by name; ordered so the backing file is written deterministically.
using EntryMap = std::map<std::string, Entry, std::less<>>;

// An entry is expired once `now` has reached its expiration instant.
[[nodiscard]] inline bool is_expired(const Entry& entry, int64_t now) noexcept {
    return entry.expiration.has_value() && *entry.expiration <= now;
}

// JSON form used in the backing file:
//   { "value": <any>, "expiration": <int|null> }
[[nodiscard]] nlohmann::json to_json(const Entry& entry);
[[nodiscard]] nlohmann::json to_json(const EntryMap& entries);

// Decode one entry. Returns std::nullopt if `j` is not an object or its
// "expiration" is neither null nor a number representable as int64_t seconds.
// A missing "value" decodes as null.
[[nodiscard]] std::optional<Entry> entry_from_json(const nlohmann::json& j);

} // namespace ttlkv
