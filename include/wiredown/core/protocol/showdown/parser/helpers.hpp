#pragma once

#include <string>
#include <string_view>
#include <cstdint>

#include "wiredown/core/protocol/showdown/parser/result.hpp"
#include "lcr/optional.hpp"

#include "simdjson.h"

/*
================================================================================
Showdown JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Low-level helpers used by the request snapshot parser to extract primitive
values from simdjson DOM elements.

Battle requests are loosely typed: almost every field is optional, several are
sometimes a scalar and sometimes an array, and "absent", null and false are
used interchangeably by the server. These helpers are therefore LENIENT:

  • A missing field, or a field of an unexpected type, leaves the output unset
  • Nothing here fails on a well-formed JSON document
  • truthy() reproduces the server's own notion of truthiness
    (null, false, 0, "", [] and {} are falsy)

IMPORTANT:
  - Helpers MUST NOT interpret values semantically
  - Helpers MUST NOT emit logs
  - Helpers MUST NOT throw exceptions

================================================================================
*/


namespace wiredown::core::protocol::showdown::parser::helper {

// ============================================================================
// TYPE CHECKS
// ============================================================================

[[nodiscard]]
inline bool is_object(const simdjson::dom::element& e) noexcept {
    return e.type() == simdjson::dom::element_type::OBJECT;
}

[[nodiscard]]
inline bool is_array(const simdjson::dom::element& e) noexcept {
    return e.type() == simdjson::dom::element_type::ARRAY;
}

[[nodiscard]]
inline bool truthy(const simdjson::dom::element& e) noexcept {
    using simdjson::dom::element_type;
    switch (e.type()) {
        case element_type::NULL_VALUE:
            return false;
        case element_type::BOOL:
            return e.get_bool().value_unsafe();
        case element_type::INT64:
            return e.get_int64().value_unsafe() != 0;
        case element_type::UINT64:
            return e.get_uint64().value_unsafe() != 0;
        case element_type::DOUBLE:
            return e.get_double().value_unsafe() != 0.0;
        case element_type::STRING:
            return !e.get_string().value_unsafe().empty();
        case element_type::ARRAY:
            return e.get_array().value_unsafe().size() > 0;
        case element_type::OBJECT:
            return e.get_object().value_unsafe().size() > 0;
        default:
            return false;
    }
}


// ============================================================================
// FIELD LOOKUP
// ============================================================================

// True when `parent` is an object that has `key` (null values count as present)
[[nodiscard]]
inline bool find_field(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!is_object(parent)) {
        return false;
    }
    return !parent[key].get(out);
}

// Field present and truthy
[[nodiscard]]
inline bool field_truthy(const simdjson::dom::element& parent, const char* key) noexcept {
    simdjson::dom::element field;
    return find_field(parent, key, field) && truthy(field);
}

// Field present and exactly the JSON literal `true`
[[nodiscard]]
inline bool field_is_true(const simdjson::dom::element& parent, const char* key) noexcept {
    simdjson::dom::element field;
    bool b = false;
    return find_field(parent, key, field) && !field.get(b) && b;
}

// Optional array field. Returns true only when the field exists and is an array.
[[nodiscard]]
inline bool parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out) noexcept {
    simdjson::dom::element field;
    if (!find_field(parent, key, field)) {
        return false;
    }
    return !field.get(out);
}


// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

inline void parse_string_optional(const simdjson::dom::element& parent, const char* key, lcr::optional<std::string>& out) {
    out.reset();
    simdjson::dom::element field;
    std::string_view sv;
    if (find_field(parent, key, field) && !field.get(sv)) {
        out = std::string(sv);
    }
}

inline void parse_int64_optional(const simdjson::dom::element& parent, const char* key, lcr::optional<std::int64_t>& out) noexcept {
    out.reset();
    simdjson::dom::element field;
    std::int64_t v = 0;
    if (find_field(parent, key, field) && !field.get(v)) {
        out = v;
    }
}

// String field with a fallback for missing or non-string values
inline void parse_string_or(const simdjson::dom::element& parent, const char* key, std::string_view fallback, std::string& out) {
    simdjson::dom::element field;
    std::string_view sv;
    if (find_field(parent, key, field) && !field.get(sv)) {
        out = std::string(sv);
    }
    else {
        out = std::string(fallback);
    }
}

} // namespace wiredown::core::protocol::showdown::parser::helper
