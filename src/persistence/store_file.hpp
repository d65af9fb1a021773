#pragma once

#include "storage/entry.hpp"

#include <filesystem>
#include <system_error>

namespace ttlkv::persistence {

// ── StoreFile ────────────────────────────────────────────────────────────────
//
// The backing file of a Store: one pretty-printed JSON object, 4-space
// indented, with a trailing newline.
//
//   {
//       "<key>": {
//           "value": <any>,
//           "expiration": <epoch seconds | null>
//       },
//       ...
//   }
//
// Atomic write: write to .tmp, fsync, then rename over the target, so a
// reader never sees a half-written file. Concurrent writers still race
// (last rename wins).
//
// Thread-safety: static methods, no mutable state.

class StoreFile {
public:
    // Default backing file, relative to the working directory.
    static constexpr const char* kDefaultPath = ".env";

    // Write `entries` to `path`, replacing any previous content.
    // Returns errc::illegal_byte_sequence, leaving `path` untouched, if a
    // string in `entries` is not valid UTF-8.
    [[nodiscard]] static std::error_code save(
        const std::filesystem::path& path,
        const EntryMap& entries);

    // Read `path` into `out`. `out` is always left holding a usable map:
    //   - missing file      → empty, returns errc::no_such_file_or_directory
    //   - malformed content → empty, returns errc::invalid_argument
    // Individual malformed entries are skipped (logged) without failing the
    // whole load.
    [[nodiscard]] static std::error_code load(
        const std::filesystem::path& path,
        EntryMap& out);
};

} // namespace ttlkv::persistence
