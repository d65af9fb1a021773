#include "storage/store.hpp"

#include "persistence/store_file.hpp"

#include <limits>
#include <string>
#include <system_error>
#include <utility>

#include <spdlog/spdlog.h>

namespace ttlkv {

Store::Store(std::filesystem::path path, std::shared_ptr<const Clock> clock)
    : path_(std::move(path)), clock_(std::move(clock)) {}

// ── Load / persist ───────────────────────────────────────────────────────────

void Store::load_locked() {
    // Missing and malformed files both leave entries_ empty; StoreFile has
    // already logged which one it was.
    if (auto ec = persistence::StoreFile::load(path_, entries_)) {
        spdlog::debug("Store: {} loaded as empty ({})", path_.string(),
                      ec.message());
    }
    loaded_ = true;

    const auto purged = purge_expired(entries_);
    if (purged > 0) {
        spdlog::info("Store: swept {} expired entries from {}", purged,
                     path_.string());
    }
    persist(entries_);
}

void Store::ensure_loaded_locked() {
    if (!loaded_) {
        load_locked();
    }
}

std::size_t Store::purge_expired(EntryMap& entries) const {
    const auto now = clock_->now();
    return std::erase_if(entries, [now](const auto& item) {
        return is_expired(item.second, now);
    });
}

void Store::persist(const EntryMap& entries) const {
    if (auto ec = persistence::StoreFile::save(path_, entries)) {
        throw std::system_error(ec, "failed to write " + path_.string());
    }
}

void Store::commit_locked(EntryMap next) {
    // entries_ only changes once the file holds the new state.
    persist(next);
    entries_ = std::move(next);
}

EntryMap Store::select_locked(bool expired) const {
    const auto now = clock_->now();
    EntryMap result;
    for (const auto& [key, entry] : entries_) {
        if (is_expired(entry, now) == expired) {
            result.emplace(key, entry);
        }
    }
    return result;
}

std::optional<int64_t> Store::compute_expiration(
    std::optional<int64_t> ttl_minutes) const {
    if (!ttl_minutes || *ttl_minutes == 0) {
        return std::nullopt;
    }

    // Saturates at the int64_t range instead of overflowing.
    constexpr auto kMax = std::numeric_limits<int64_t>::max();
    constexpr auto kMin = std::numeric_limits<int64_t>::min();
    const auto now     = clock_->now();
    const auto minutes = *ttl_minutes;

    if (minutes > 0) {
        if (minutes > kMax / 60) return kMax;
        const auto seconds = minutes * 60;
        if (now > 0 && seconds > kMax - now) return kMax;
        return now + seconds;
    }

    if (minutes < kMin / 60) return kMin;
    const auto seconds = minutes * 60;
    if (now < 0 && seconds < kMin - now) return kMin;
    return now + seconds;
}

// ── Reloading operations ─────────────────────────────────────────────────────

EntryMap Store::sync() {
    std::lock_guard lock(mutex_);
    load_locked();
    return entries_;
}

void Store::add(std::string_view key, Value value,
                std::optional<int64_t> ttl_minutes) {
    std::lock_guard lock(mutex_);
    load_locked();
    auto next = entries_;
    next.insert_or_assign(
        std::string(key), Entry{std::move(value), compute_expiration(ttl_minutes)});
    commit_locked(std::move(next));
    spdlog::debug("Store: add '{}'", key);
}

bool Store::update(std::string_view key, Value value,
                   std::optional<int64_t> ttl_minutes) {
    std::lock_guard lock(mutex_);
    load_locked();
    if (entries_.find(key) == entries_.end()) {
        spdlog::debug("Store: update '{}' ignored, key absent", key);
        return false;
    }
    auto next = entries_;
    auto it   = next.find(key);
    it->second.value      = std::move(value);
    it->second.expiration = compute_expiration(ttl_minutes);
    commit_locked(std::move(next));
    spdlog::debug("Store: update '{}'", key);
    return true;
}

bool Store::remove(std::string_view key) {
    std::lock_guard lock(mutex_);
    load_locked();
    auto next = entries_;
    bool existed = false;
    if (auto it = next.find(key); it != next.end()) {
        next.erase(it);
        existed = true;
    }
    commit_locked(std::move(next));
    spdlog::debug("Store: remove '{}' (existed={})", key, existed);
    return existed;
}

std::optional<Value> Store::get(std::string_view key) {
    std::lock_guard lock(mutex_);
    load_locked();
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return it->second.value;
}

EntryMap Store::get_all() {
    std::lock_guard lock(mutex_);
    load_locked();
    return entries_;
}

// ── In-memory operations ─────────────────────────────────────────────────────

bool Store::expire(std::string_view key) {
    std::lock_guard lock(mutex_);
    ensure_loaded_locked();
    if (entries_.find(key) == entries_.end()) {
        return false;
    }
    auto next = entries_;
    next.find(key)->second.expiration = clock_->now();
    commit_locked(std::move(next));
    spdlog::debug("Store: expire '{}'", key);
    return true;
}

void Store::expire_all() {
    std::lock_guard lock(mutex_);
    ensure_loaded_locked();
    const auto now = clock_->now();
    auto next = entries_;
    for (auto& [_, entry] : next) {
        entry.expiration = now;
    }
    commit_locked(std::move(next));
    spdlog::debug("Store: expired all {} entries", entries_.size());
}

EntryMap Store::get_expired_details() {
    std::lock_guard lock(mutex_);
    ensure_loaded_locked();
    return select_locked(true);
}

EntryMap Store::get_active_details() {
    std::lock_guard lock(mutex_);
    ensure_loaded_locked();
    return select_locked(false);
}

void Store::remove_all() {
    std::lock_guard lock(mutex_);
    commit_locked(EntryMap{});
    loaded_ = true;
    spdlog::debug("Store: removed all entries from {}", path_.string());
}

std::size_t Store::expire_all_expired() {
    std::lock_guard lock(mutex_);
    ensure_loaded_locked();
    auto next = entries_;
    const auto purged = purge_expired(next);
    commit_locked(std::move(next));
    return purged;
}

std::size_t Store::size() const {
    std::lock_guard lock(mutex_);
    return entries_.size();
}

// ── default_store ────────────────────────────────────────────────────────────

Store& default_store() {
    static Store store{persistence::StoreFile::kDefaultPath};
    return store;
}

} // namespace ttlkv
