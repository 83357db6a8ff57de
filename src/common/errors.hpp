#pragma once

#include <filesystem>
#include <stdexcept>
#include <string>
#include <system_error>

namespace pmap {

// ── StoreError ────────────────────────────────────────────────────────────────
//
// Base of every error thrown by the pmap library.  Catch this to handle all
// store failures uniformly.

class StoreError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

// ── Filesystem errors ─────────────────────────────────────────────────────────

// An underlying filesystem call failed.  `code()` is the OS error.
class IOError : public StoreError {
public:
    IOError(const std::string& action,
            std::filesystem::path path,
            std::error_code ec);

    [[nodiscard]] const std::error_code& code() const noexcept { return code_; }
    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
    std::error_code code_;
};

class IOReadError final : public IOError {
public:
    IOReadError(std::filesystem::path path, std::error_code ec);
};

class IOWriteError final : public IOError {
public:
    IOWriteError(std::filesystem::path path, std::error_code ec);
};

// ── Content errors ────────────────────────────────────────────────────────────

// Raised by the JSON codec when text is not exactly one valid document.
class ParseError final : public StoreError {
public:
    using StoreError::StoreError;
};

// The backing file is non-empty but does not hold a JSON object.
class CorruptStoreError final : public StoreError {
public:
    CorruptStoreError(std::filesystem::path path, const std::string& reason);

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

private:
    std::filesystem::path path_;
};

// A stored value has no JSON text representation (raised at save time only).
class SerializationError final : public StoreError {
public:
    using StoreError::StoreError;
};

// ── Mapping errors ────────────────────────────────────────────────────────────

class KeyNotFoundError final : public StoreError {
public:
    explicit KeyNotFoundError(std::string key);

    [[nodiscard]] const std::string& key() const noexcept { return key_; }

private:
    std::string key_;
};

class EmptyContainerError final : public StoreError {
public:
    explicit EmptyContainerError(const std::string& operation);
};

} // namespace pmap
