#include "common/errors.hpp"

#include <utility>

#include <fmt/format.h>

namespace pmap {

IOError::IOError(const std::string& action,
                 std::filesystem::path path,
                 std::error_code ec)
    : StoreError{fmt::format("failed to {} {}: {}", action, path.string(),
                             ec.message())}
    , path_{std::move(path)}
    , code_{ec}
{}

IOReadError::IOReadError(std::filesystem::path path, std::error_code ec)
    : IOError{"read", std::move(path), ec}
{}

IOWriteError::IOWriteError(std::filesystem::path path, std::error_code ec)
    : IOError{"write", std::move(path), ec}
{}

CorruptStoreError::CorruptStoreError(std::filesystem::path path,
                                     const std::string& reason)
    : StoreError{fmt::format("corrupt store {}: {}", path.string(), reason)}
    , path_{std::move(path)}
{}

KeyNotFoundError::KeyNotFoundError(std::string key)
    : StoreError{fmt::format("key not found: '{}'", key)}
    , key_{std::move(key)}
{}

EmptyContainerError::EmptyContainerError(const std::string& operation)
    : StoreError{fmt::format("{}(): map is empty", operation)}
{}

} // namespace pmap
