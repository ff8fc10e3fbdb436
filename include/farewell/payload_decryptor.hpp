// ============================================================================
// Farewell - Payload Decryptor
// ============================================================================
// Decrypts the encryptedPayload of a claim package with AES-128-GCM.
//
// Expected input format: [nonce (12 bytes)] + [ciphertext] + [auth tag (16 bytes)]
//
// AES-GCM decryption VERIFIES the authentication tag:
// - If the ciphertext or tag was modified -> DecryptionAuthFailure
// - If the key is wrong (wrong secret)    -> DecryptionAuthFailure
// - If the nonce was changed              -> DecryptionAuthFailure
// No plaintext is ever returned when the tag does not verify.
// ============================================================================

#ifndef FAREWELL_PAYLOAD_DECRYPTOR_HPP
#define FAREWELL_PAYLOAD_DECRYPTOR_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace farewell {

/// Authenticated decryption of claim-package payloads
class PayloadDecryptor {
public:
    PayloadDecryptor() = default;
    ~PayloadDecryptor() = default;

    // Non-copyable, non-movable
    PayloadDecryptor(const PayloadDecryptor&) = delete;
    PayloadDecryptor& operator=(const PayloadDecryptor&) = delete;
    PayloadDecryptor(PayloadDecryptor&&) = delete;
    PayloadDecryptor& operator=(PayloadDecryptor&&) = delete;

    /// Decrypt a payload back to raw bytes
    /// @param payload The encoded payload (format: [nonce][ciphertext][tag])
    /// @param key The 16-byte AES-128 key
    /// @return The plaintext, or MalformedPayload / KeyLengthMismatch /
    ///         DecryptionAuthFailure
    [[nodiscard]] static Result<ByteBuffer> decrypt(
        ByteSpan payload,
        ByteSpan key
    );

    /// Decrypt a payload to UTF-8 text
    /// @return The message, or EncodingError if the authentic bytes are not UTF-8
    [[nodiscard]] static Result<std::string> decrypt_text(
        ByteSpan payload,
        ByteSpan key
    );

    /// Decrypt the hex form found in claim packages
    /// @param payload_hex Hex of [nonce][ciphertext][tag], "0x" optional
    /// @param key The 16-byte AES-128 key
    [[nodiscard]] static Result<std::string> decrypt_hex(
        std::string_view payload_hex,
        ByteSpan key
    );

private:
    [[nodiscard]] static Result<ByteBuffer> decrypt_impl(
        ByteSpan ciphertext,  // Just the encrypted data (no nonce/tag)
        ByteSpan key,
        ByteSpan nonce,
        ByteSpan tag
    );
};

} // namespace farewell

#endif // FAREWELL_PAYLOAD_DECRYPTOR_HPP
