#include "storage/entry.hpp"

#include <cmath>
#include <limits>

namespace ttlkv {

namespace {

// Doubles that convert to int64_t without overflow: [-2^63, 2^63).
constexpr double kMinSeconds           = -9223372036854775808.0;
constexpr double kMaxSecondsExclusive  =  9223372036854775808.0;

} // anonymous namespace

nlohmann::json to_json(const Entry& entry) {
    nlohmann::json j = nlohmann::json::object();
    j["value"] = entry.value;
    if (entry.expiration) {
        j["expiration"] = *entry.expiration;
    } else {
        j["expiration"] = nullptr;
    }
    return j;
}

nlohmann::json to_json(const EntryMap& entries) {
    nlohmann::json j = nlohmann::json::object();
    for (const auto& [key, entry] : entries) {
        j[key] = to_json(entry);
    }
    return j;
}

std::optional<Entry> entry_from_json(const nlohmann::json& j) {
    if (!j.is_object()) {
        return std::nullopt;
    }

    Entry entry;
    if (auto it = j.find("value"); it != j.end()) {
        entry.value = *it;
    }

    if (auto it = j.find("expiration"); it != j.end() && !it->is_null()) {
        if (!it->is_number()) {
            return std::nullopt;
        }
        if (it->is_number_float()) {
            // Fractional timestamps are truncated to whole seconds.
            const auto seconds = it->get<double>();
            if (!std::isfinite(seconds) || seconds < kMinSeconds ||
                seconds >= kMaxSecondsExclusive) {
                return std::nullopt;
            }
            entry.expiration = static_cast<int64_t>(seconds);
        } else if (it->is_number_unsigned()) {
            const auto seconds = it->get<uint64_t>();
            if (seconds > static_cast<uint64_t>(std::numeric_limits<int64_t>::max())) {
                return std::nullopt;
            }
            entry.expiration = static_cast<int64_t>(seconds);
        } else {
            entry.expiration = it->get<int64_t>();
        }
    }
    return entry;
}

} // namespace ttlkv
