#include "persistence/store_file.hpp"

#include <cerrno>
#include <fstream>
#include <iterator>
#include <string>

#include <fcntl.h>
#include <unistd.h>

#include <nlohmann/json.hpp>
#include <spdlog/spdlog.h>

namespace ttlkv::persistence {

namespace {

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return {errno, std::system_category()};
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

}  // namespace

// ── StoreFile::save ──────────────────────────────────────────────────────────

std::error_code StoreFile::save(
    const std::filesystem::path& path,
    const EntryMap& entries) {

    std::string text;
    try {
        text = to_json(entries).dump(4);
    } catch (const nlohmann::json::exception& e) {
        // Strings that are not valid UTF-8 cannot be written as JSON.
        spdlog::error("StoreFile: cannot serialise entries for {}: {}",
                      path.string(), e.what());
        return std::make_error_code(std::errc::illegal_byte_sequence);
    }
    text += '\n';

    auto tmp_path = path;
    tmp_path += ".tmp";

    int fd = ::open(tmp_path.c_str(), O_WRONLY | O_CREAT | O_TRUNC, 0644);
    if (fd < 0) {
        auto ec = std::error_code{errno, std::system_category()};
        spdlog::error("StoreFile: failed to open tmp file {}: {}",
                      tmp_path.string(), ec.message());
        return ec;
    }

    auto ec = write_all(fd, text.data(), text.size());
    if (ec) {
        spdlog::error("StoreFile: write failed: {}", ec.message());
        ::close(fd);
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    if (::fsync(fd) < 0) {
        ec = {errno, std::system_category()};
        spdlog::error("StoreFile: fsync failed: {}", ec.message());
        ::close(fd);
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return ec;
    }

    ::close(fd);

    std::error_code rename_ec;
    std::filesystem::rename(tmp_path, path, rename_ec);
    if (rename_ec) {
        spdlog::error("StoreFile: rename failed: {}", rename_ec.message());
        std::error_code ignored;
        std::filesystem::remove(tmp_path, ignored);
        return rename_ec;
    }

    spdlog::debug("StoreFile: saved {} entries to {}", entries.size(),
                  path.string());
    return {};
}

// ── StoreFile::load ──────────────────────────────────────────────────────────

std::error_code StoreFile::load(
    const std::filesystem::path& path,
    EntryMap& out) {

    out.clear();

    std::ifstream in(path, std::ios::binary);
    if (!in) {
        spdlog::debug("StoreFile: {} not found, starting empty", path.string());
        return std::make_error_code(std::errc::no_such_file_or_directory);
    }

    const std::string text{std::istreambuf_iterator<char>(in),
                           std::istreambuf_iterator<char>()};

    auto doc = nlohmann::json::parse(text, nullptr, /*allow_exceptions=*/false);
    if (doc.is_discarded()) {
        spdlog::warn("StoreFile: {} is not valid JSON, starting empty",
                     path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }

    // An empty store has historically been written as "[]".
    if (doc.is_array() && doc.empty()) {
        return {};
    }

    if (!doc.is_object()) {
        spdlog::warn("StoreFile: {} does not hold a JSON object, starting empty",
                     path.string());
        return std::make_error_code(std::errc::invalid_argument);
    }

    for (const auto& [key, item] : doc.items()) {
        auto entry = entry_from_json(item);
        if (!entry) {
            spdlog::warn("StoreFile: skipping malformed entry '{}' in {}",
                         key, path.string());
            continue;
        }
        out.emplace(key, std::move(*entry));
    }

    spdlog::debug("StoreFile: loaded {} entries from {}", out.size(),
                  path.string());
    return {};
}

} // namespace ttlkv::persistence
