// ============================================================================
// Farewell - Payload Encryptor
// ============================================================================
// The sender-side counterpart of PayloadDecryptor. Produces payloads in the
// claim-package layout:
//
//     [nonce (12 bytes)] + [ciphertext] + [auth tag (16 bytes)]
//
// Used to build claim packages and test fixtures. A nonce must never be
// reused with the same key; encrypt() draws a fresh random one every call.
// ============================================================================

#ifndef FAREWELL_PAYLOAD_ENCRYPTOR_HPP
#define FAREWELL_PAYLOAD_ENCRYPTOR_HPP

#include "types.hpp"
#include <string_view>

namespace farewell {

/// AES-128-GCM encryption in the claim-package payload layout
class PayloadEncryptor {
public:
    PayloadEncryptor() = default;
    ~PayloadEncryptor() = default;

    // Non-copyable, non-movable
    PayloadEncryptor(const PayloadEncryptor&) = delete;
    PayloadEncryptor& operator=(const PayloadEncryptor&) = delete;
    PayloadEncryptor(PayloadEncryptor&&) = delete;
    PayloadEncryptor& operator=(PayloadEncryptor&&) = delete;

    /// Encrypt bytes under a fresh random nonce
    /// @param plaintext Data to encrypt (may be empty)
    /// @param key The 16-byte AES-128 key
    /// @return [nonce][ciphertext][tag], or an error
    [[nodiscard]] static Result<ByteBuffer> encrypt(ByteSpan plaintext, ByteSpan key);

    /// Encrypt a UTF-8 message under a fresh random nonce
    [[nodiscard]] static Result<ByteBuffer> encrypt_text(std::string_view plaintext, ByteSpan key);

    /// Encrypt with a caller-chosen nonce (deterministic output for fixtures)
    /// @param nonce Exactly 12 bytes
    [[nodiscard]] static Result<ByteBuffer> encrypt_with_nonce(
        ByteSpan plaintext,
        ByteSpan key,
        ByteSpan nonce
    );

    /// Generate a random 16-byte key
    [[nodiscard]] static Result<SecureBuffer> generate_key();

    /// Generate a random 12-byte nonce
    [[nodiscard]] static Result<ByteBuffer> generate_nonce();
};

} // namespace farewell

#endif // FAREWELL_PAYLOAD_ENCRYPTOR_HPP
