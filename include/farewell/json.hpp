// ============================================================================
// Farewell - JSON Helpers
// ============================================================================
// Thin layer over json-c shared by the claim parser, the proof assembler and
// the proof validator:
// - Object: owning handle (json_object_put on destruction)
// - parse(): strict parse of a complete document into an Object
// - typed accessors that keep JSON kinds apart (a string is never a number)
//
// json-c represents a JSON null as a null json_object*. find() therefore
// returns std::optional: nullopt for an absent member, nullptr for null.
// ============================================================================

#ifndef FAREWELL_JSON_HPP
#define FAREWELL_JSON_HPP

#include "types.hpp"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

struct json_object;

namespace farewell::json {

struct ObjectDeleter {
    void operator()(json_object* value) const noexcept;
};

/// Owning json-c handle
using Object = std::unique_ptr<json_object, ObjectDeleter>;

/// Parse a complete JSON document
/// @return The value (null for a literal `null`), or MalformedInput
[[nodiscard]] Result<Object> parse(std::string_view text);

/// Indented JSON text with a trailing newline
[[nodiscard]] std::string serialize(json_object* value);

/// Member `key` of an object; nullopt when absent
[[nodiscard]] std::optional<json_object*> find(json_object* object, const char* key);

[[nodiscard]] bool is_object(json_object* value) noexcept;
[[nodiscard]] bool is_array(json_object* value) noexcept;
[[nodiscard]] bool is_string(json_object* value) noexcept;

/// Contents of a JSON string (caller checks is_string first)
[[nodiscard]] std::string_view string_value(json_object* value) noexcept;

/// The value if it is a non-negative JSON integer
[[nodiscard]] std::optional<std::uint64_t> as_uint64(json_object* value) noexcept;

/// "object", "array", "string", "integer", "number", "boolean" or "null"
[[nodiscard]] std::string_view type_name(json_object* value) noexcept;

} // namespace farewell::json

#endif // FAREWELL_JSON_HPP
