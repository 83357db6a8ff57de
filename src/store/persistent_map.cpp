#include "store/persistent_map.hpp"
#include "common/errors.hpp"
#include "persistence/json_codec.hpp"

#include <stdexcept>

namespace pmap {

using persistence::BackingFile;
using persistence::JsonCodec;

// ── Construction ──────────────────────────────────────────────────────────────

PersistentMap::PersistentMap(std::filesystem::path path, StoreOptions options)
    : path_{std::move(path)}
    , autosave_{options.autosave}
    , write_mode_{options.write_mode}
    , indent_{options.indent}
    , logger_{options.logger ? std::move(options.logger) : spdlog::default_logger()}
    , entries_(Value::object())
{
    if (!options.defaults.is_null() && !options.defaults.is_object()) {
        throw std::invalid_argument("PersistentMap: defaults must be a JSON object");
    }

    bool created = false;
    auto ec = BackingFile::ensure(path_, created);
    if (ec) {
        throw IOWriteError(path_, ec);
    }

    std::uintmax_t bytes = 0;
    ec = BackingFile::size(path_, bytes);
    if (ec) {
        logger_->error("PersistentMap: cannot stat {}: {}", path_.string(), ec.message());
        throw IOReadError(path_, ec);
    }

    const bool blank = bytes == 0;
    if (!blank) {
        std::string text;
        ec = BackingFile::read(path_, text);
        if (ec) {
            logger_->error("PersistentMap: cannot read {}: {}", path_.string(), ec.message());
            throw IOReadError(path_, ec);
        }
        try {
            entries_ = JsonCodec::parse_object(text);
        } catch (const ParseError& e) {
            logger_->error("PersistentMap: {} is not a JSON object: {}",
                           path_.string(), e.what());
            throw CorruptStoreError(path_, e.what());
        }
    }

    const auto seeded = seed(options.defaults);

    logger_->info("PersistentMap: opened {} ({} entries, {} defaults applied{})",
                  path_.string(), entries_.size(), seeded,
                  created ? ", file created" : "");

    if (autosave_) {
        save();
    } else if (blank) {
        write_document(Value::object());
    }
}

PersistentMap PersistentMap::open(std::filesystem::path path,
                                  bool autosave,
                                  Value defaults) {
    StoreOptions options;
    options.autosave = autosave;
    options.defaults = std::move(defaults);
    return PersistentMap{std::move(path), std::move(options)};
}

// ── Read access ───────────────────────────────────────────────────────────────

std::optional<Value> PersistentMap::get(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return std::nullopt;
    }
    return *it;
}

Value PersistentMap::get(const std::string& key, Value fallback) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        return fallback;
    }
    return *it;
}

const Value& PersistentMap::at(const std::string& key) const {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw KeyNotFoundError(key);
    }
    return *it;
}

bool PersistentMap::contains(const std::string& key) const {
    return entries_.find(key) != entries_.end();
}

std::size_t PersistentMap::size() const noexcept {
    return entries_.size();
}

bool PersistentMap::empty() const noexcept {
    return entries_.empty();
}

std::vector<std::string> PersistentMap::keys() const {
    std::vector<std::string> result;
    result.reserve(entries_.size());
    for (auto it = entries_.begin(); it != entries_.end(); ++it) {
        result.push_back(it.key());
    }
    return result;
}

std::string PersistentMap::to_string() const {
    // Lossy rendering for diagnostics: never throws on invalid UTF-8.
    return "PersistentMap(" +
           entries_.dump(-1, ' ', false, Value::error_handler_t::replace) + ")";
}

std::ostream& operator<<(std::ostream& os, const PersistentMap& map) {
    return os << map.to_string();
}

// ── Mutation ──────────────────────────────────────────────────────────────────

void PersistentMap::set(std::string key, Value value) {
    entries_[std::move(key)] = std::move(value);
    persist_if_autosave();
}

void PersistentMap::erase(const std::string& key) {
    if (entries_.erase(key) == 0) {
        throw KeyNotFoundError(key);
    }
    persist_if_autosave();
}

void PersistentMap::update(const Value& other) {
    if (!other.is_object()) {
        throw std::invalid_argument("PersistentMap::update: argument must be a JSON object");
    }
    entries_.update(other);
    persist_if_autosave();
}

void PersistentMap::clear() {
    entries_ = Value::object();
    persist_if_autosave();
}

Value PersistentMap::pop(const std::string& key) {
    auto it = entries_.find(key);
    if (it == entries_.end()) {
        throw KeyNotFoundError(key);
    }
    Value result = std::move(*it);
    entries_.erase(it);
    persist_if_autosave();
    return result;
}

Value PersistentMap::pop(const std::string& key, Value fallback) {
    Value result = std::move(fallback);
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        result = std::move(*it);
        entries_.erase(it);
    }
    persist_if_autosave();
    return result;
}

std::pair<std::string, Value> PersistentMap::popitem() {
    auto& object = entries_.get_ref<Value::object_t&>();
    if (object.empty()) {
        throw EmptyContainerError("popitem");
    }

    // object_t keeps insertion order, so back() is the newest entry.
    std::pair<std::string, Value> result{object.back().first,
                                         std::move(object.back().second)};
    object.pop_back();
    persist_if_autosave();
    return result;
}

const Value& PersistentMap::setdefault(std::string key, Value default_value) {
    auto it = entries_.find(key);
    if (it != entries_.end()) {
        return *it;
    }

    auto& slot = entries_[std::move(key)];
    slot = std::move(default_value);
    persist_if_autosave();
    return slot;
}

std::size_t PersistentMap::set_defaults(const Value& defaults) {
    if (!defaults.is_null() && !defaults.is_object()) {
        throw std::invalid_argument("PersistentMap::set_defaults: argument must be a JSON object");
    }
    const auto inserted = seed(defaults);
    if (inserted > 0) {
        persist_if_autosave();
    }
    return inserted;
}

std::size_t PersistentMap::seed(const Value& defaults) {
    if (defaults.is_null()) {
        return 0;
    }

    std::size_t inserted = 0;
    for (auto it = defaults.begin(); it != defaults.end(); ++it) {
        if (!entries_.contains(it.key())) {
            entries_[it.key()] = it.value();
            ++inserted;
        }
    }
    return inserted;
}

// ── Persistence ───────────────────────────────────────────────────────────────

void PersistentMap::save() {
    write_document(entries_);
}

void PersistentMap::save(const Value& patch) {
    if (patch.is_null()) {
        save();
        return;
    }
    if (!patch.is_object()) {
        throw std::invalid_argument("PersistentMap::save: patch must be a JSON object");
    }
    for (auto it = patch.begin(); it != patch.end(); ++it) {
        set(it.key(), it.value());
    }
    save();
}

void PersistentMap::persist_if_autosave() {
    if (autosave_) {
        save();
    }
}

void PersistentMap::write_document(const Value& document) {
    std::string text;
    try {
        text = JsonCodec::serialize(document, indent_);
    } catch (const SerializationError& e) {
        logger_->error("PersistentMap: cannot serialize {}: {}", path_.string(), e.what());
        throw;
    }

    auto ec = BackingFile::write(path_, text, write_mode_);
    if (ec) {
        logger_->error("PersistentMap: write to {} failed: {}", path_.string(), ec.message());
        throw IOWriteError(path_, ec);
    }

    logger_->debug("PersistentMap: saved {} entries ({} bytes) to {}",
                   document.size(), text.size(), path_.string());
}

PersistentMap::SaveScope PersistentMap::scope() {
    return SaveScope{*this};
}

// ── SaveScope ─────────────────────────────────────────────────────────────────

PersistentMap::SaveScope::~SaveScope() {
    if (map_ == nullptr) {
        return;
    }
    try {
        map_->save();
    } catch (const StoreError& e) {
        map_->logger_->error("PersistentMap: save on scope exit failed for {}: {}",
                             map_->path_.string(), e.what());
    }
}

void PersistentMap::SaveScope::close() {
    if (map_ == nullptr) {
        return;
    }
    auto* map = std::exchange(map_, nullptr);
    map->save();
}

} // namespace pmap
