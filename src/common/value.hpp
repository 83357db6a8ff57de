#pragma once

#include <nlohmann/json.hpp>

namespace pmap {

// JSON value model shared by the store and its codec.  Objects keep insertion
// order, so keys() and popitem() follow the order entries were added.
using Value = nlohmann::ordered_json;

} // namespace pmap
