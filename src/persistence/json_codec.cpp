#include "persistence/json_codec.hpp"
#include "common/errors.hpp"

#include <cmath>
#include <string>

#include <fmt/format.h>

namespace pmap::persistence {

namespace {

// Append one reference token to a JSON pointer (RFC 6901 escaping).
std::string child_pointer(const std::string& parent, std::string_view token) {
    std::string out = parent;
    out += '/';
    for (char c : token) {
        if (c == '~') {
            out += "~0";
        } else if (c == '/') {
            out += "~1";
        } else {
            out += c;
        }
    }
    return out;
}

// Reject values the serializer would silently rewrite (non-finite floats
// become null) or emit as non-standard text (binary).
void check_representable(const Value& value, const std::string& pointer) {
    switch (value.type()) {
    case Value::value_t::number_float: {
        const auto d = value.get<double>();
        if (!std::isfinite(d)) {
            throw SerializationError(fmt::format(
                "non-finite number at '{}' cannot be written as JSON",
                pointer.empty() ? "/" : pointer));
        }
        break;
    }
    case Value::value_t::binary:
        throw SerializationError(fmt::format(
            "binary value at '{}' cannot be written as JSON",
            pointer.empty() ? "/" : pointer));
    case Value::value_t::object:
        for (const auto& [key, child] : value.items()) {
            check_representable(child, child_pointer(pointer, key));
        }
        break;
    case Value::value_t::array: {
        std::size_t index = 0;
        for (const auto& child : value) {
            check_representable(child, child_pointer(pointer, std::to_string(index++)));
        }
        break;
    }
    default:
        break;
    }
}

} // anonymous namespace

Value JsonCodec::parse(std::string_view text) {
    try {
        return Value::parse(text.begin(), text.end());
    } catch (const Value::parse_error& e) {
        throw ParseError(e.what());
    }
}

Value JsonCodec::parse_object(std::string_view text) {
    auto value = parse(text);
    if (!value.is_object()) {
        throw ParseError(fmt::format(
            "expected a JSON object at top level, got {}", value.type_name()));
    }
    return value;
}

std::string JsonCodec::serialize(const Value& value, int indent) {
    check_representable(value, "");
    try {
        // Strict error handler: invalid UTF-8 throws type_error 316.
        return value.dump(indent < 0 ? -1 : indent, ' ', false,
                          Value::error_handler_t::strict);
    } catch (const Value::type_error& e) {
        throw SerializationError(e.what());
    }
}

} // namespace pmap::persistence
