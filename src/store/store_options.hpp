#pragma once

#include "common/value.hpp"
#include "persistence/backing_file.hpp"

#include <memory>

#include <spdlog/spdlog.h>

namespace pmap {

// ── StoreOptions ──────────────────────────────────────────────────────────────
// Construction-time settings of a PersistentMap.

struct StoreOptions {
    bool autosave = true;                   // persist after every mutation
    Value defaults = Value::object();       // seeded for keys absent on disk
    persistence::WriteMode write_mode = persistence::WriteMode::Direct;
    int indent = -1;                        // JSON indent, -1 = compact
    std::shared_ptr<spdlog::logger> logger; // null = spdlog default logger
};

} // namespace pmap
