// ============================================================================
// Farewell - Common Types and Error Handling
// ============================================================================
// This header defines the foundational types used throughout Farewell:
// - Error codes, the Error value and result types using C++23 std::expected
// - Secure byte containers
// - Cipher and proof-shape constants
// ============================================================================

#ifndef FAREWELL_TYPES_HPP
#define FAREWELL_TYPES_HPP

#include <cstdint>
#include <expected>
#include <span>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace farewell {

// ============================================================================
// Byte Types
// ============================================================================

/// A single byte (unsigned 8-bit integer)
using Byte = std::uint8_t;

/// A dynamically-sized container for bytes (keys, payloads, digests)
using ByteBuffer = std::vector<Byte>;

/// A read-only view into a byte sequence
using ByteSpan = std::span<const Byte>;

/// A mutable view into a byte sequence
using MutableByteSpan = std::span<Byte>;

// ============================================================================
// Error Codes
// ============================================================================

/// All possible error conditions in Farewell
enum class ErrorCode {
    Success = 0,

    // Input Errors (100-199)
    MissingField = 100,
    MalformedInput = 101,

    // Key Errors (200-299)
    KeyLengthMismatch = 200,
    RandomGenerationFailed = 201,

    // Payload Errors (300-399)
    MalformedPayload = 300,
    DecryptionAuthFailure = 301,  // Tag mismatch: tampered data or wrong key
    EncodingError = 302,
    CipherInitFailed = 303,
    CipherUpdateFailed = 304,
    CipherFinalizeFailed = 305,

    // Proof Errors (400-499)
    RecipientCountMismatch = 400,
    ValidationFailure = 401,
    HashFailed = 402,

    // File I/O Errors (500-599)
    FileNotFound = 500,
    FileReadError = 501,
    FileWriteError = 502,
    FileTooLarge = 503,

    // General Errors (600-699)
    InvalidArgument = 600,
    InternalError = 601,
};

/// Convert an error code to a human-readable string
[[nodiscard]] constexpr std::string_view error_to_string(ErrorCode code) noexcept {
    switch (code) {
        case ErrorCode::Success: return "Success";

        // Input
        case ErrorCode::MissingField: return "Missing required field";
        case ErrorCode::MalformedInput: return "Malformed input";

        // Key
        case ErrorCode::KeyLengthMismatch: return "Key share and secret do not form a 16-byte key";
        case ErrorCode::RandomGenerationFailed: return "Random generation failed";

        // Payload
        case ErrorCode::MalformedPayload: return "Malformed encrypted payload";
        case ErrorCode::DecryptionAuthFailure: return "Authentication failed - wrong key or tampered payload!";
        case ErrorCode::EncodingError: return "Decrypted message is not valid UTF-8";
        case ErrorCode::CipherInitFailed: return "Cipher initialization failed";
        case ErrorCode::CipherUpdateFailed: return "Cipher update failed";
        case ErrorCode::CipherFinalizeFailed: return "Cipher finalization failed";

        // Proof
        case ErrorCode::RecipientCountMismatch: return "Recipient count mismatch";
        case ErrorCode::ValidationFailure: return "Delivery proof validation failed";
        case ErrorCode::HashFailed: return "Hash computation failed";

        // File I/O
        case ErrorCode::FileNotFound: return "File not found";
        case ErrorCode::FileReadError: return "File read error";
        case ErrorCode::FileWriteError: return "File write error";
        case ErrorCode::FileTooLarge: return "File too large";

        // General
        case ErrorCode::InvalidArgument: return "Invalid argument";
        case ErrorCode::InternalError: return "Internal error";

        default: return "Unknown error";
    }
}

/// An error code plus the detail an operator needs to fix the input
/// (which field, which recipient index, which cipher check)
struct Error {
    ErrorCode code = ErrorCode::InternalError;
    std::string detail;

    Error() = default;
    Error(ErrorCode error_code, std::string error_detail = {})
        : code(error_code), detail(std::move(error_detail)) {}

    /// "<description>: <detail>", or just the description when there is no detail
    [[nodiscard]] std::string message() const {
        std::string text(error_to_string(code));
        if (!detail.empty()) {
            text += ": ";
            text += detail;
        }
        return text;
    }
};

// ============================================================================
// Result Type (using C++23 std::expected)
// ============================================================================

/// A result type that either contains a value T or an Error
/// Usage: if (auto key = KeyReconstructor::reconstruct(a, b); key) { use(*key); }
///        else { report(key.error().message()); }
template <typename T>
using Result = std::expected<T, Error>;

/// A result type for operations that don't return a value
using VoidResult = std::expected<void, Error>;

/// Shorthand for returning a failure from a Result-returning function
[[nodiscard]] inline std::unexpected<Error> fail(ErrorCode code, std::string detail = {}) {
    return std::unexpected(Error{code, std::move(detail)});
}

// ============================================================================
// Constants
// ============================================================================

namespace constants {

/// AES-128 key size in bytes; key shares and secrets have the same length
inline constexpr std::size_t AES_KEY_SIZE = 16;

/// AES-GCM nonce/IV size in bytes (96 bits, recommended by NIST)
inline constexpr std::size_t AES_GCM_NONCE_SIZE = 12;

/// AES-GCM authentication tag size in bytes (128 bits)
inline constexpr std::size_t AES_GCM_TAG_SIZE = 16;

/// Smallest well-formed payload: nonce + tag around an empty ciphertext
inline constexpr std::size_t MIN_PAYLOAD_SIZE = AES_GCM_NONCE_SIZE + AES_GCM_TAG_SIZE;

/// Digest used for recipient commitments; must match the on-chain verifier
inline constexpr const char* COMMITMENT_DIGEST = "SHA256";

/// Commitment digest size in bytes
inline constexpr std::size_t COMMITMENT_SIZE = 32;

/// Discriminator of the claim-package input shape
inline constexpr std::string_view CLAIM_PACKAGE_TYPE = "farewell-claim-package";

/// Discriminator and version of the delivery-proof envelope
inline constexpr std::string_view DELIVERY_PROOF_TYPE = "farewell-delivery-proof";
inline constexpr int DELIVERY_PROOF_VERSION = 1;

/// Number of public signals emitted per recipient proof
/// [0] recipient commitment, [1] DKIM key hash, [2] content hash
inline constexpr std::size_t PUBLIC_SIGNAL_COUNT = 3;

/// Maximum size of any file read by the CLI (claim packages, sent messages)
inline constexpr std::size_t MAX_FILE_SIZE = 25 * 1024 * 1024;

} // namespace constants

// ============================================================================
// Secure Memory Utilities
// ============================================================================

/// Securely zero out memory (prevents compiler optimization from removing it)
inline void secure_zero(MutableByteSpan buffer) noexcept {
    volatile Byte* ptr = buffer.data();
    for (std::size_t i = 0; i < buffer.size(); ++i) {
        ptr[i] = 0;
    }
}

/// RAII wrapper for key material that zeros itself on destruction
class SecureBuffer {
public:
    SecureBuffer() = default;

    explicit SecureBuffer(std::size_t size) : data_(size) {}

    explicit SecureBuffer(ByteSpan data) : data_(data.begin(), data.end()) {}

    SecureBuffer(SecureBuffer&& other) noexcept : data_(std::move(other.data_)) {}
    SecureBuffer& operator=(SecureBuffer&& other) noexcept {
        if (this != &other) {
            clear();
            data_ = std::move(other.data_);
        }
        return *this;
    }

    // No copying (avoid accidental key duplication)
    SecureBuffer(const SecureBuffer&) = delete;
    SecureBuffer& operator=(const SecureBuffer&) = delete;

    ~SecureBuffer() { clear(); }

    /// Securely clear the buffer
    void clear() noexcept {
        if (!data_.empty()) {
            secure_zero(data_);
            data_.clear();
        }
    }

    [[nodiscard]] Byte* data() noexcept { return data_.data(); }
    [[nodiscard]] const Byte* data() const noexcept { return data_.data(); }

    [[nodiscard]] std::size_t size() const noexcept { return data_.size(); }

    [[nodiscard]] bool empty() const noexcept { return data_.empty(); }

    [[nodiscard]] ByteSpan span() const noexcept { return ByteSpan{data_}; }

    /// Copy out the bytes (use sparingly, the copy is not zeroed)
    [[nodiscard]] ByteBuffer to_buffer() const { return data_; }

private:
    ByteBuffer data_;
};

} // namespace farewell

#endif // FAREWELL_TYPES_HPP
