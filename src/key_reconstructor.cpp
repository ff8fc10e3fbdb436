// ============================================================================
// Farewell - Key Reconstructor Implementation
// ============================================================================

#include "farewell/key_reconstructor.hpp"
#include "farewell/encoding.hpp"

#include <format>

namespace farewell {

Result<SecureBuffer> KeyReconstructor::reconstruct(ByteSpan key_share, ByteSpan secret) {
    if (key_share.size() != secret.size()) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("skShare is {} bytes but the secret is {} bytes",
                                key_share.size(), secret.size()));
    }

    if (!is_valid_share_size(key_share)) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("skShare and secret are {} bytes, expected {}",
                                key_share.size(), constants::AES_KEY_SIZE));
    }

    SecureBuffer key(constants::AES_KEY_SIZE);
    for (std::size_t i = 0; i < constants::AES_KEY_SIZE; ++i) {
        key.data()[i] = static_cast<Byte>(key_share[i] ^ secret[i]);
    }

    return key;
}

Result<SecureBuffer> KeyReconstructor::reconstruct_hex(
    std::string_view key_share_hex,
    std::string_view secret_hex
) {
    auto share = encoding::hex_decode(key_share_hex);
    if (!share) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("skShare is not valid hex ({})", share.error().detail));
    }

    // The decoded secret is key material too, keep it in a SecureBuffer
    auto secret_bytes = encoding::hex_decode(secret_hex);
    if (!secret_bytes) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("secret is not valid hex ({})", secret_bytes.error().detail));
    }
    SecureBuffer secret(*secret_bytes);
    secure_zero(*secret_bytes);

    return reconstruct(*share, secret.span());
}

bool KeyReconstructor::is_valid_share_size(ByteSpan part) noexcept {
    return part.size() == constants::AES_KEY_SIZE;
}

} // namespace farewell
