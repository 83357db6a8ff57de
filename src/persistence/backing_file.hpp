#pragma once

#include <cstdint>
#include <filesystem>
#include <string>
#include <string_view>
#include <system_error>

namespace pmap::persistence {

// How a save replaces the backing file.
enum class WriteMode : uint8_t {
    Direct = 0,  // truncate and overwrite in place (not crash-safe)
    Atomic = 1,  // write <path>.tmp, fsync, rename over <path>
};

// ── BackingFile ──────────────────────────────────────────────────────────────
//
// Whole-file text I/O for the single file that mirrors a PersistentMap.
// Every operation reports failure as a std::error_code; nothing here throws
// (apart from std::bad_alloc).
//
// Thread-safety: static methods, no mutable state.  No file locking is done:
// concurrent writers to one path overwrite each other.

class BackingFile {
public:
    // Suffix of the temporary file used by WriteMode::Atomic.
    static constexpr const char* kTempSuffix = ".tmp";

    // True if `path` names an existing filesystem entry.
    [[nodiscard]] static bool exists(const std::filesystem::path& path);

    // Size in bytes of the regular file at `path`.
    [[nodiscard]] static std::error_code size(const std::filesystem::path& path,
                                              std::uintmax_t& out);

    // Create the parent directories of `path` (recursive, idempotent) and an
    // empty file at `path` if nothing exists there yet.  `created` reports
    // whether the file was created by this call.
    [[nodiscard]] static std::error_code ensure(const std::filesystem::path& path,
                                                bool& created);

    // Read the entire file into `out`.
    [[nodiscard]] static std::error_code read(const std::filesystem::path& path,
                                              std::string& out);

    // Replace the file content with `text`.
    [[nodiscard]] static std::error_code write(const std::filesystem::path& path,
                                               std::string_view text,
                                               WriteMode mode = WriteMode::Direct);
};

} // namespace pmap::persistence
