// ============================================================================
// Farewell - JSON Helpers Implementation
// ============================================================================

#include "farewell/json.hpp"

// json-c
#include <json-c/json.h>

// Standard library
#include <format>
#include <limits>

namespace farewell::json {

namespace {

struct TokenerDeleter {
    void operator()(json_tokener* tokener) const { if (tokener) json_tokener_free(tokener); }
};
using UniqueTokener = std::unique_ptr<json_tokener, TokenerDeleter>;

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r';
}

} // anonymous namespace

void ObjectDeleter::operator()(json_object* value) const noexcept {
    if (value) {
        json_object_put(value);
    }
}

// ============================================================================
// Parsing and Rendering
// ============================================================================

Result<Object> parse(std::string_view text) {
    UniqueTokener tokener(json_tokener_new());
    if (!tokener) {
        return fail(ErrorCode::InternalError, "json_tokener_new");
    }
    json_tokener_set_flags(tokener.get(), JSON_TOKENER_STRICT);

    if (text.size() >= static_cast<std::size_t>(std::numeric_limits<int>::max())) {
        return fail(ErrorCode::MalformedInput, "JSON document too large");
    }

    // The terminating NUL is passed along so a top-level number is complete
    std::string buffer(text);
    Object value(json_tokener_parse_ex(tokener.get(), buffer.c_str(),
                                       static_cast<int>(buffer.size() + 1)));

    json_tokener_error error = json_tokener_get_error(tokener.get());
    std::size_t end = json_tokener_get_parse_end(tokener.get());
    if (error == json_tokener_continue) {
        return fail(ErrorCode::MalformedInput, "invalid JSON: unexpected end of input");
    }
    if (error != json_tokener_success) {
        return fail(ErrorCode::MalformedInput,
                    std::format("invalid JSON at offset {}: {}", end, json_tokener_error_desc(error)));
    }

    for (std::size_t i = end; i < buffer.size(); ++i) {
        if (!is_space(buffer[i])) {
            return fail(ErrorCode::MalformedInput,
                        std::format("invalid JSON: unexpected content at offset {}", i));
        }
    }

    return value;
}

std::string serialize(json_object* value) {
    const int flags = JSON_C_TO_STRING_PRETTY | JSON_C_TO_STRING_SPACED | JSON_C_TO_STRING_NOSLASHESCAPE;
    std::string text = json_object_to_json_string_ext(value, flags);
    text += '\n';
    return text;
}

// ============================================================================
// Accessors
// ============================================================================

std::optional<json_object*> find(json_object* object, const char* key) {
    json_object* member = nullptr;
    if (!is_object(object) || !json_object_object_get_ex(object, key, &member)) {
        return std::nullopt;
    }
    return member;
}

bool is_object(json_object* value) noexcept {
    return value && json_object_is_type(value, json_type_object);
}

bool is_array(json_object* value) noexcept {
    return value && json_object_is_type(value, json_type_array);
}

bool is_string(json_object* value) noexcept {
    return value && json_object_is_type(value, json_type_string);
}

std::string_view string_value(json_object* value) noexcept {
    if (!is_string(value)) {
        return {};
    }
    return {json_object_get_string(value), static_cast<std::size_t>(json_object_get_string_len(value))};
}

std::optional<std::uint64_t> as_uint64(json_object* value) noexcept {
    if (!value || !json_object_is_type(value, json_type_int)) {
        return std::nullopt;
    }
    // get_int64 saturates at INT64_MAX for larger unsigned values
    if (json_object_get_int64(value) < 0) {
        return std::nullopt;
    }
    return json_object_get_uint64(value);
}

std::string_view type_name(json_object* value) noexcept {
    switch (json_object_get_type(value)) {
        case json_type_object: return "object";
        case json_type_array: return "array";
        case json_type_string: return "string";
        case json_type_int: return "integer";
        case json_type_double: return "number";
        case json_type_boolean: return "boolean";
        case json_type_null: return "null";
    }
    return "unknown";
}

} // namespace farewell::json
