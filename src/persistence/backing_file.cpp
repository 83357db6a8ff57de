#include "persistence/backing_file.hpp"

#include <array>
#include <cerrno>

#include <fcntl.h>
#include <unistd.h>

#include <spdlog/spdlog.h>

namespace pmap::persistence {

namespace {

[[nodiscard]] std::error_code last_error() {
    return {errno, std::system_category()};
}

// Write all bytes to fd. Returns error_code on failure.
[[nodiscard]] std::error_code write_all(int fd, const char* data,
                                        std::size_t len) {
    std::size_t written = 0;
    while (written < len) {
        auto n = ::write(fd, data + written, len - written);
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        written += static_cast<std::size_t>(n);
    }
    return {};
}

// Read from fd until EOF, appending to `out`.
[[nodiscard]] std::error_code read_to_end(int fd, std::string& out) {
    std::array<char, 8192> chunk{};
    while (true) {
        auto n = ::read(fd, chunk.data(), chunk.size());
        if (n < 0) {
            if (errno == EINTR) continue;
            return last_error();
        }
        if (n == 0) {
            return {};
        }
        out.append(chunk.data(), static_cast<std::size_t>(n));
    }
}

// Open `path` for writing with O_TRUNC, write `text`, optionally fsync, close.
[[nodiscard]] std::error_code write_file(const std::filesystem::path& path,
                                         std::string_view text,
                                         bool sync) {
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_TRUNC | O_CLOEXEC, 0644);
    if (fd < 0) {
        return last_error();
    }

    auto ec = write_all(fd, text.data(), text.size());
    if (!ec && sync && ::fsync(fd) < 0) {
        ec = last_error();
    }
    if (::close(fd) < 0 && !ec) {
        ec = last_error();
    }
    return ec;
}

} // anonymous namespace

// ── BackingFile::exists ──────────────────────────────────────────────────────

bool BackingFile::exists(const std::filesystem::path& path) {
    std::error_code ec;
    return std::filesystem::exists(path, ec);
}

// ── BackingFile::size ────────────────────────────────────────────────────────

std::error_code BackingFile::size(const std::filesystem::path& path,
                                  std::uintmax_t& out) {
    std::error_code ec;
    auto n = std::filesystem::file_size(path, ec);
    if (ec) {
        return ec;
    }
    out = n;
    return {};
}

// ── BackingFile::ensure ──────────────────────────────────────────────────────

std::error_code BackingFile::ensure(const std::filesystem::path& path,
                                    bool& created) {
    created = false;

    const auto parent = path.parent_path();
    if (!parent.empty()) {
        std::error_code ec;
        std::filesystem::create_directories(parent, ec);
        if (ec) {
            spdlog::error("BackingFile: failed to create directory {}: {}",
                          parent.string(), ec.message());
            return ec;
        }
    }

    // O_EXCL: leave an existing entry (file, directory, …) untouched.
    int fd = ::open(path.c_str(), O_WRONLY | O_CREAT | O_EXCL | O_CLOEXEC, 0644);
    if (fd < 0) {
        if (errno == EEXIST) {
            return {};
        }
        auto ec = last_error();
        spdlog::error("BackingFile: failed to create {}: {}",
                      path.string(), ec.message());
        return ec;
    }
    if (::close(fd) < 0) {
        return last_error();
    }

    created = true;
    return {};
}

// ── BackingFile::read ────────────────────────────────────────────────────────

std::error_code BackingFile::read(const std::filesystem::path& path,
                                  std::string& out) {
    int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        return last_error();
    }

    out.clear();
    auto ec = read_to_end(fd, out);
    ::close(fd);
    return ec;
}

// ── BackingFile::write ───────────────────────────────────────────────────────

std::error_code BackingFile::write(const std::filesystem::path& path,
                                   std::string_view text,
                                   WriteMode mode) {
    if (mode == WriteMode::Direct) {
        return write_file(path, text, /*sync=*/false);
    }

    // Atomic write: write to .tmp, fsync, rename.
    auto tmp_path = path;
    tmp_path += kTempSuffix;

    auto ec = write_file(tmp_path, text, /*sync=*/true);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }

    std::filesystem::rename(tmp_path, path, ec);
    if (ec) {
        std::error_code rm_ec;
        std::filesystem::remove(tmp_path, rm_ec);
        return ec;
    }
    return {};
}

} // namespace pmap::persistence
