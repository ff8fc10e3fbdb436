// ============================================================================
// Farewell - Encoding Helpers
// ============================================================================
// Every binary value in a claim package travels as a hex string, optionally
// prefixed with "0x". These helpers convert between that form and bytes and
// check that decrypted text is well-formed UTF-8.
// ============================================================================

#ifndef FAREWELL_ENCODING_HPP
#define FAREWELL_ENCODING_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace farewell::encoding {

/// Remove a leading "0x" / "0X" if present
[[nodiscard]] std::string_view strip_hex_prefix(std::string_view text) noexcept;

/// True if `text` (after an optional 0x prefix) is a non-empty run of hex
/// digits of any length. Used for content hashes and numeric proof fields.
[[nodiscard]] bool is_hex_string(std::string_view text) noexcept;

/// Decode a hex string into bytes
/// @param text Hex digits, optional 0x prefix, even length
/// @return The bytes, or MalformedInput describing the first problem
[[nodiscard]] Result<ByteBuffer> hex_decode(std::string_view text);

/// Encode bytes as lower-case hex
/// @param data The bytes to encode
/// @param with_prefix Prepend "0x" (the form used in JSON documents)
[[nodiscard]] std::string hex_encode(ByteSpan data, bool with_prefix = true);

/// Check that bytes form valid UTF-8 (no overlongs, surrogates or values > U+10FFFF)
[[nodiscard]] bool is_valid_utf8(ByteSpan data) noexcept;

/// View a string's characters as bytes
[[nodiscard]] inline ByteSpan as_bytes(std::string_view text) noexcept {
    return ByteSpan{reinterpret_cast<const Byte*>(text.data()), text.size()};
}

} // namespace farewell::encoding

#endif // FAREWELL_ENCODING_HPP
