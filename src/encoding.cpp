// ============================================================================
// Farewell - Encoding Helpers Implementation
// ============================================================================

#include "farewell/encoding.hpp"

#include <format>

namespace farewell::encoding {

namespace {

int hex_value(char c) noexcept {
    if (c >= '0' && c <= '9') return c - '0';
    if (c >= 'a' && c <= 'f') return c - 'a' + 10;
    if (c >= 'A' && c <= 'F') return c - 'A' + 10;
    return -1;
}

} // anonymous namespace

// ============================================================================
// Hex
// ============================================================================

std::string_view strip_hex_prefix(std::string_view text) noexcept {
    if (text.starts_with("0x") || text.starts_with("0X")) {
        text.remove_prefix(2);
    }
    return text;
}

bool is_hex_string(std::string_view text) noexcept {
    std::string_view digits = strip_hex_prefix(text);
    if (digits.empty()) {
        return false;
    }
    for (char c : digits) {
        if (hex_value(c) < 0) {
            return false;
        }
    }
    return true;
}

Result<ByteBuffer> hex_decode(std::string_view text) {
    std::string_view digits = strip_hex_prefix(text);

    if (digits.size() % 2 != 0) {
        return fail(ErrorCode::MalformedInput,
                    std::format("hex string has odd length {}", digits.size()));
    }

    ByteBuffer bytes;
    bytes.reserve(digits.size() / 2);

    for (std::size_t i = 0; i < digits.size(); i += 2) {
        int high = hex_value(digits[i]);
        int low = hex_value(digits[i + 1]);
        if (high < 0 || low < 0) {
            std::size_t bad = high < 0 ? i : i + 1;
            return fail(ErrorCode::MalformedInput,
                        std::format("invalid hex character '{}' at offset {}", digits[bad], bad));
        }
        bytes.push_back(static_cast<Byte>((high << 4) | low));
    }

    return bytes;
}

std::string hex_encode(ByteSpan data, bool with_prefix) {
    std::string out;
    out.reserve(data.size() * 2 + 2);
    if (with_prefix) {
        out += "0x";
    }
    for (Byte b : data) {
        out += std::format("{:02x}", b);
    }
    return out;
}

// ============================================================================
// UTF-8
// ============================================================================

bool is_valid_utf8(ByteSpan data) noexcept {
    std::size_t i = 0;
    while (i < data.size()) {
        Byte lead = data[i];

        if (lead < 0x80) {
            ++i;
            continue;
        }

        std::size_t length = 0;
        std::uint32_t code_point = 0;
        if ((lead & 0xE0) == 0xC0) {
            length = 2;
            code_point = lead & 0x1F;
        } else if ((lead & 0xF0) == 0xE0) {
            length = 3;
            code_point = lead & 0x0F;
        } else if ((lead & 0xF8) == 0xF0) {
            length = 4;
            code_point = lead & 0x07;
        } else {
            return false;  // Stray continuation byte or 0xF8..0xFF
        }

        if (i + length > data.size()) {
            return false;  // Truncated sequence
        }

        for (std::size_t j = 1; j < length; ++j) {
            Byte next = data[i + j];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            code_point = (code_point << 6) | (next & 0x3F);
        }

        // Reject overlong encodings, UTF-16 surrogates and out-of-range values
        if ((length == 2 && code_point < 0x80) ||
            (length == 3 && code_point < 0x800) ||
            (length == 4 && code_point < 0x10000) ||
            (code_point >= 0xD800 && code_point <= 0xDFFF) ||
            code_point > 0x10FFFF) {
            return false;
        }

        i += length;
    }
    return true;
}

} // namespace farewell::encoding
