#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

#include "lightsync/core/decimal.hpp"
#include "lightsync/core/protocol/parser/result.hpp"

#include "simdjson.h"

/*
================================================================================
JSON Parsing Helpers (Low-Level Primitives)
================================================================================

Helpers extract primitive values from simdjson DOM elements for the message
parsers. They are schema-agnostic and shared by every channel.

Conventions:
  • A field whose value is JSON null counts as absent
  • Required helpers report InvalidSchema when the field is missing or has the
    wrong type
  • Optional helpers reset their output first and report Parsed when the
    field is absent
  • Decimal and text helpers accept either a JSON string or a JSON number,
    since the venue is not consistent about quoting numeric values
  • Malformed decimal text is InvalidValue

IMPORTANT:
  - Helpers MUST NOT log
  - Helpers MUST NOT throw
================================================================================
*/


namespace lightsync::core::protocol::parser::helper {

// ============================================================================
// ROOT TYPE / LOOKUP
// ============================================================================

[[nodiscard]]
inline Result require_object(const simdjson::dom::element& el) noexcept {
    return el.is_object() ? Result::Parsed : Result::InvalidSchema;
}

// True when `key` exists on `obj` and is not null
[[nodiscard]]
inline bool find(const simdjson::dom::element& obj, const char* key, simdjson::dom::element& out) noexcept {
    if (!obj.is_object()) {
        return false;
    }
    auto field = obj[key];
    if (field.error()) {
        return false;
    }
    out = field.value_unsafe();
    return !out.is_null();
}

[[nodiscard]]
inline Result parse_object_required(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out) noexcept {
    if (!find(parent, key, out)) {
        return Result::InvalidSchema;
    }
    return require_object(out);
}

[[nodiscard]]
inline Result parse_object_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::element& out, bool& present) noexcept {
    present = false;
    if (!find(parent, key, out)) {
        return Result::Parsed;
    }
    if (!out.is_object()) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_array_optional(const simdjson::dom::element& parent, const char* key, simdjson::dom::array& out, bool& present) noexcept {
    present = false;
    simdjson::dom::element el;
    if (!find(parent, key, el)) {
        return Result::Parsed;
    }
    if (el.get(out)) {
        return Result::InvalidSchema;
    }
    present = true;
    return Result::Parsed;
}


// ============================================================================
// REQUIRED FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (el.get(sv)) {
        return Result::InvalidSchema;
    }
    out.assign(sv.data(), sv.size());
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_uint64_required(const simdjson::dom::element& obj, const char* key, std::uint64_t& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::InvalidSchema;
    }
    if (el.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_required(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::InvalidSchema;
    }
    if (el.get(out)) {
        return Result::InvalidSchema;
    }
    return Result::Parsed;
}

// String or number, kept as text
[[nodiscard]]
inline Result parse_text_required(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (!el.get(sv)) {
        out.assign(sv.data(), sv.size());
        return Result::Parsed;
    }
    std::int64_t i{};
    if (!el.get(i)) {
        out = std::to_string(i);
        return Result::Parsed;
    }
    std::uint64_t u{};
    if (!el.get(u)) {
        out = std::to_string(u);
        return Result::Parsed;
    }
    return Result::InvalidSchema;
}

[[nodiscard]]
inline Result parse_decimal_required(const simdjson::dom::element& obj, const char* key, Decimal& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::InvalidSchema;
    }
    std::string_view sv;
    if (!el.get(sv)) {
        return decimal::parse(sv, out) ? Result::Parsed : Result::InvalidValue;
    }
    if (el.is_number()) {
        // Shortest text form of the number as written by simdjson
        try {
            const std::string text = simdjson::minify(el);
            return decimal::parse(text, out) ? Result::Parsed : Result::InvalidValue;
        } catch (const std::exception&) {
            return Result::InvalidValue;
        }
    }
    return Result::InvalidSchema;
}


// ============================================================================
// OPTIONAL FIELD PARSERS
// ============================================================================

[[nodiscard]]
inline Result parse_string_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::string>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    std::string_view sv;
    if (el.get(sv)) {
        return Result::InvalidSchema;
    }
    out.emplace(sv);
    return Result::Parsed;
}

// Absent -> out keeps its current (default) value
[[nodiscard]]
inline Result parse_text_or(const simdjson::dom::element& obj, const char* key, std::string& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    return parse_text_required(obj, key, out);
}

[[nodiscard]]
inline Result parse_bool_optional(const simdjson::dom::element& obj, const char* key, std::optional<bool>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    bool tmp{};
    if (el.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_bool_or(const simdjson::dom::element& obj, const char* key, bool& out) noexcept {
    std::optional<bool> tmp;
    auto r = parse_bool_optional(obj, key, tmp);
    if (r == Result::Parsed && tmp) {
        out = *tmp;
    }
    return r;
}

[[nodiscard]]
inline Result parse_uint64_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::uint64_t>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    std::uint64_t tmp{};
    if (el.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_optional(const simdjson::dom::element& obj, const char* key, std::optional<std::int64_t>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    std::int64_t tmp{};
    if (el.get(tmp)) {
        return Result::InvalidSchema;
    }
    out = tmp;
    return Result::Parsed;
}

[[nodiscard]]
inline Result parse_int64_or(const simdjson::dom::element& obj, const char* key, std::int64_t& out) noexcept {
    std::optional<std::int64_t> tmp;
    auto r = parse_int64_optional(obj, key, tmp);
    if (r == Result::Parsed && tmp) {
        out = *tmp;
    }
    return r;
}

[[nodiscard]]
inline Result parse_decimal_optional(const simdjson::dom::element& obj, const char* key, std::optional<Decimal>& out) noexcept {
    out.reset();
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        return Result::Parsed;
    }
    Decimal tmp;
    auto r = parse_decimal_required(obj, key, tmp);
    if (r == Result::Parsed) {
        out = std::move(tmp);
    }
    return r;
}

// Absent -> zero
[[nodiscard]]
inline Result parse_decimal_or_zero(const simdjson::dom::element& obj, const char* key, Decimal& out) noexcept {
    simdjson::dom::element el;
    if (!find(obj, key, el)) {
        out = 0;
        return Result::Parsed;
    }
    return parse_decimal_required(obj, key, out);
}

} // namespace lightsync::core::protocol::parser::helper
