#pragma once

#include "common/value.hpp"
#include "persistence/backing_file.hpp"
#include "store/store_options.hpp"

#include <cstddef>
#include <filesystem>
#include <functional>
#include <memory>
#include <optional>
#include <ostream>
#include <string>
#include <type_traits>
#include <utility>
#include <vector>

#include <spdlog/spdlog.h>

namespace pmap {

// ── PersistentMap ─────────────────────────────────────────────────────────────
//
// Ordered string -> JSON mapping mirrored to a single JSON file.
//
// Construction:
//   1. Creates the parent directories and the file if missing.
//   2. Loads the file if it is non-empty (CorruptStoreError if it is not a
//      JSON object, IOReadError if it cannot be read).
//   3. Seeds `defaults` for keys the file does not already hold.
//   4. With autosave on, saves immediately.  With autosave off, a missing or
//      empty file is initialised to `{}`.
//
// Persistence contract:
//   - With autosave on, every mutating call rewrites the whole file after
//     updating memory.  setdefault() only writes when it inserts; failing
//     calls (erase/pop of a missing key, popitem on empty) never write.
//   - save() always writes, regardless of autosave.
//   - Destruction does not flush.  Use save(), autosave or scope().
//   - A failed write is not rolled back: memory keeps the mutation and the
//     file keeps its previous content.
//
// Values that JSON text cannot represent (NaN, binary, invalid UTF-8) are
// accepted in memory and rejected with SerializationError by the next save.
//
// Thread-safety: none.  Two instances on the same path do not see each
// other's changes and the last full write wins.

class PersistentMap {
public:
    using const_iterator = Value::const_iterator;

    class SaveScope;

    // Opens (creating if needed) the store at `path`.
    explicit PersistentMap(std::filesystem::path path, StoreOptions options = {});

    // Shorthand for the common case.
    [[nodiscard]] static PersistentMap open(std::filesystem::path path,
                                            bool autosave = true,
                                            Value defaults = Value::object());

    ~PersistentMap() = default;

    // Not copyable – two live copies would silently clobber the same file.
    PersistentMap(const PersistentMap&)            = delete;
    PersistentMap& operator=(const PersistentMap&) = delete;

    PersistentMap(PersistentMap&&)            = default;
    PersistentMap& operator=(PersistentMap&&) = default;

    // ── Read access (never touches the filesystem) ───────────────────────────

    // Returns the value for `key`, or std::nullopt if not present.
    [[nodiscard]] std::optional<Value> get(const std::string& key) const;

    // Returns the value for `key`, or `fallback` if not present.
    [[nodiscard]] Value get(const std::string& key, Value fallback) const;

    // Throws KeyNotFoundError if `key` is not present.
    [[nodiscard]] const Value& at(const std::string& key) const;

    [[nodiscard]] bool contains(const std::string& key) const;
    [[nodiscard]] std::size_t size() const noexcept;
    [[nodiscard]] bool empty() const noexcept;

    // Keys in insertion order.
    [[nodiscard]] std::vector<std::string> keys() const;

    // Iterates entries in insertion order; use it.key() / it.value().
    [[nodiscard]] const_iterator begin() const noexcept { return entries_.cbegin(); }
    [[nodiscard]] const_iterator end() const noexcept { return entries_.cend(); }

    // The whole mapping as a JSON object.
    [[nodiscard]] const Value& data() const noexcept { return entries_; }

    [[nodiscard]] const std::filesystem::path& path() const noexcept { return path_; }

    [[nodiscard]] bool autosave() const noexcept { return autosave_; }
    void set_autosave(bool enabled) noexcept { autosave_ = enabled; }

    // "PersistentMap({...})"
    [[nodiscard]] std::string to_string() const;

    // ── Mutation ─────────────────────────────────────────────────────────────

    // Inserts or overwrites `key`.
    void set(std::string key, Value value);

    // Removes `key`.  Throws KeyNotFoundError if absent.
    void erase(const std::string& key);

    // Inserts or overwrites every member of `other`, which must be an object
    // (std::invalid_argument otherwise, with nothing applied).
    void update(const Value& other);

    // Removes all entries.  The file becomes `{}`, never zero bytes.
    void clear();

    // Removes `key` and returns its value.  Throws KeyNotFoundError if absent.
    Value pop(const std::string& key);

    // Removes `key` and returns its value, or returns `fallback` if absent.
    Value pop(const std::string& key, Value fallback);

    // Removes and returns the most recently inserted entry.
    // Throws EmptyContainerError on an empty map.
    std::pair<std::string, Value> popitem();

    // Returns the value of `key`, inserting `default_value` first if absent.
    // The reference is invalidated by the next insertion or removal.
    const Value& setdefault(std::string key, Value default_value);

    // setdefault() for every member of `defaults` (an object or null), with a
    // single write if anything was inserted.  Returns the number inserted.
    std::size_t set_defaults(const Value& defaults);

    // ── Persistence ──────────────────────────────────────────────────────────

    // Serializes the whole map to the backing file, ignoring autosave.
    // Throws SerializationError or IOWriteError.
    void save();

    // Applies `patch` (an object) through set(), then save().  A null patch
    // is the same as save().
    void save(const Value& patch);

    // RAII guard that saves when it goes out of scope.
    [[nodiscard]] SaveScope scope();

    // Calls fn(*this) and saves afterwards, whether fn returns or throws.
    // Exceptions from fn are rethrown after the save.
    template <typename Fn>
    auto scoped(Fn&& fn);

private:
    // Inserts each absent member of `defaults`.  Returns the number inserted.
    std::size_t seed(const Value& defaults);

    void persist_if_autosave();

    // Serialize `document` and write it to path_.
    void write_document(const Value& document);

    std::filesystem::path path_;
    bool autosave_;
    persistence::WriteMode write_mode_;
    int indent_;
    std::shared_ptr<spdlog::logger> logger_;
    Value entries_;
};

// ── PersistentMap::SaveScope ──────────────────────────────────────────────────
//
//   {
//       auto scope = store.scope();
//       scope->set("a", 1);
//       scope->erase("b");
//   }   // saved here, also when an exception unwinds the block
//
// A save failing inside the destructor is logged at error level; call close()
// to save with exceptions propagated instead.

class PersistentMap::SaveScope {
public:
    explicit SaveScope(PersistentMap& map) noexcept : map_{&map} {}
    ~SaveScope();

    SaveScope(const SaveScope&)            = delete;
    SaveScope& operator=(const SaveScope&) = delete;

    SaveScope(SaveScope&& other) noexcept
        : map_{std::exchange(other.map_, nullptr)} {}
    SaveScope& operator=(SaveScope&&) = delete;

    PersistentMap& operator*() const noexcept { return *map_; }
    PersistentMap* operator->() const noexcept { return map_; }

    // Saves now and disarms the destructor.  Throws like save().
    void close();

private:
    PersistentMap* map_;
};

template <typename Fn>
auto PersistentMap::scoped(Fn&& fn) {
    using Result = std::invoke_result_t<Fn&, PersistentMap&>;

    if constexpr (std::is_void_v<Result>) {
        try {
            std::invoke(fn, *this);
        } catch (...) {
            // A failing save replaces the in-flight exception.
            save();
            throw;
        }
        save();
    } else {
        auto result = [&]() -> std::decay_t<Result> {
            try {
                return std::invoke(fn, *this);
            } catch (...) {
                save();
                throw;
            }
        }();
        save();
        return result;
    }
}

std::ostream& operator<<(std::ostream& os, const PersistentMap& map);

} // namespace pmap
