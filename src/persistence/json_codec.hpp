#pragma once

#include "common/value.hpp"

#include <string>
#include <string_view>

namespace pmap::persistence {

// ── JsonCodec ────────────────────────────────────────────────────────────────
//
// Text codec for the backing file.  The whole input must be exactly one JSON
// document: trailing data after the value is a parse error.
//
// Thread-safety: static methods, no mutable state.

class JsonCodec {
public:
    // Parse `text` into a Value.  Throws ParseError on malformed input.
    [[nodiscard]] static Value parse(std::string_view text);

    // As parse(), but the top-level value must be an object.
    [[nodiscard]] static Value parse_object(std::string_view text);

    // Serialize `value`.  indent < 0 produces compact output.
    // Throws SerializationError for values JSON text cannot carry:
    // NaN / infinity, binary blobs, strings or keys that are not valid UTF-8.
    [[nodiscard]] static std::string serialize(const Value& value, int indent = -1);
};

} // namespace pmap::persistence
