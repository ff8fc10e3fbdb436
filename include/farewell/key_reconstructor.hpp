// ============================================================================
// Farewell - Key Reconstructor
// ============================================================================
// A claim package carries only half of the message key: the on-chain key
// share (skShare). The other half is an off-chain secret (s') known to the
// sender and the recipient. The AES-128 key is their byte-wise XOR:
//
//     key = skShare XOR s'
//
// Both halves must be exactly 16 bytes. Anything else cannot yield a key and
// is reported as KeyLengthMismatch.
//
// All keys are returned in SecureBuffer so they are zeroed on destruction.
// ============================================================================

#ifndef FAREWELL_KEY_RECONSTRUCTOR_HPP
#define FAREWELL_KEY_RECONSTRUCTOR_HPP

#include "types.hpp"
#include <string_view>

namespace farewell {

/// Combines a key share and an off-chain secret into the symmetric key
class KeyReconstructor {
public:
    KeyReconstructor() = default;
    ~KeyReconstructor() = default;

    // Stateless
    KeyReconstructor(const KeyReconstructor&) = delete;
    KeyReconstructor& operator=(const KeyReconstructor&) = delete;
    KeyReconstructor(KeyReconstructor&&) = delete;
    KeyReconstructor& operator=(KeyReconstructor&&) = delete;

    /// XOR the key share with the secret
    /// @param key_share The on-chain share (16 bytes)
    /// @param secret The off-chain secret (16 bytes)
    /// @return The 16-byte key, or KeyLengthMismatch
    [[nodiscard]] static Result<SecureBuffer> reconstruct(
        ByteSpan key_share,
        ByteSpan secret
    );

    /// Hex-decode both halves, then reconstruct
    /// @param key_share_hex The skShare field of a claim package ("0x" optional)
    /// @param secret_hex The off-chain secret ("0x" optional)
    /// @return The 16-byte key, or KeyLengthMismatch (also for undecodable hex)
    [[nodiscard]] static Result<SecureBuffer> reconstruct_hex(
        std::string_view key_share_hex,
        std::string_view secret_hex
    );

    /// True if `part` has the length of a key share / secret
    [[nodiscard]] static bool is_valid_share_size(ByteSpan part) noexcept;
};

} // namespace farewell

#endif // FAREWELL_KEY_RECONSTRUCTOR_HPP
