#pragma once

#include "storage/clock.hpp"
#include "storage/entry.hpp"

#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <string_view>

namespace ttlkv {

// ── Store ────────────────────────────────────────────────────────────────────
//
// Key-value store with per-key expiration, persisted to a single JSON file.
//
// Every call is a full read-modify-write against the backing file:
//   - sync(), add(), update(), remove(), get(), get_all() reload the file,
//     sweep expired entries and persist before doing their work.
//   - expire(), expire_all(), get_expired_details(), get_active_details(),
//     remove_all(), expire_all_expired() work on the in-memory snapshot from
//     the last reload (a never-loaded Store reloads once first).
// After any mutating call the file holds exactly the in-memory state.
//
// Concurrency model:
//   Calls on one Store are serialised by an internal mutex. Nothing
//   coordinates separate Store objects or processes sharing a file: the last
//   writer wins.
//
// Errors:
//   A missing or malformed backing file is an empty store. A failed write
//   throws std::system_error and leaves the in-memory state unchanged.
class Store {
public:
    explicit Store(std::filesystem::path path,
                   std::shared_ptr<const Clock> clock = std::make_shared<SystemClock>());

    Store(const Store&)            = delete;
    Store& operator=(const Store&) = delete;
    Store(Store&&)                 = delete;
    Store& operator=(Store&&)      = delete;

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    // Reload from disk, drop expired entries, persist. Returns the result.
    EntryMap sync();

    // Insert or overwrite `key`. A ttl of nullopt or 0 never expires.
    void add(std::string_view key, Value value,
             std::optional<int64_t> ttl_minutes = std::nullopt);

    // Replace value and expiration of an existing `key`.
    // Returns false (and leaves the store untouched) if `key` is absent.
    bool update(std::string_view key, Value value,
                std::optional<int64_t> ttl_minutes = std::nullopt);

    // Removes `key`. Returns true if the key existed.
    bool remove(std::string_view key);

    // Returns the live value for `key`, or std::nullopt if absent or expired.
    [[nodiscard]] std::optional<Value> get(std::string_view key);

    // Returns every live entry.
    [[nodiscard]] EntryMap get_all();

    // Marks `key` as expired as of now; it is dropped on the next reload.
    // Returns false if `key` is not in memory.
    bool expire(std::string_view key);

    // Marks every in-memory entry as expired as of now.
    void expire_all();

    // Entries whose expiration is set and has been reached.
    [[nodiscard]] EntryMap get_expired_details();

    // Entries with no expiration or an expiration still in the future.
    [[nodiscard]] EntryMap get_active_details();

    // Removes all entries.
    void remove_all();

    // Deletes every in-memory entry that is expired. Returns how many.
    std::size_t expire_all_expired();

    // Number of entries currently held in memory (no reload).
    [[nodiscard]] std::size_t size() const;

    // Absolute expiration for a ttl in minutes; nullopt for nullopt or 0.
    // Saturates at the int64_t limits for ttls too large to represent.
    [[nodiscard]] std::optional<int64_t> compute_expiration(
        std::optional<int64_t> ttl_minutes) const;

private:
    void load_locked();
    void ensure_loaded_locked();
    std::size_t purge_expired(EntryMap& entries) const;
    void persist(const EntryMap& entries) const;
    void commit_locked(EntryMap next);
    [[nodiscard]] EntryMap select_locked(bool expired) const;

    std::filesystem::path path_;
    std::shared_ptr<const Clock> clock_;

    mutable std::mutex mutex_;
    EntryMap entries_;
    bool loaded_ = false;
};

// Process-wide Store bound to StoreFile::kDefaultPath (".env"), created on
// first use. Prefer owning a Store; this exists for callers that want a
// static-style entry point.
Store& default_store();

} // namespace ttlkv
