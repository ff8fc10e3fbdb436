// ============================================================================
// Farewell - Payload Decryptor Implementation
// ============================================================================

#include "farewell/payload_decryptor.hpp"
#include "farewell/encoding.hpp"
#include "farewell/key_reconstructor.hpp"

// OpenSSL headers
#include <openssl/evp.h>

// Standard library
#include <format>
#include <memory>

namespace farewell {

namespace {

struct CipherCtxDeleter {
    void operator()(EVP_CIPHER_CTX* ctx) const { if (ctx) EVP_CIPHER_CTX_free(ctx); }
};
using UniqueCipherCtx = std::unique_ptr<EVP_CIPHER_CTX, CipherCtxDeleter>;

} // anonymous namespace

// ============================================================================
// Internal Implementation
// ============================================================================

Result<ByteBuffer> PayloadDecryptor::decrypt_impl(
    ByteSpan ciphertext,
    ByteSpan key,
    ByteSpan nonce,
    ByteSpan tag
) {
    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return fail(ErrorCode::CipherInitFailed, "EVP_CIPHER_CTX_new");
    }

    if (EVP_DecryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1) {
        return fail(ErrorCode::CipherInitFailed, "AES-128-GCM init");
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::AES_GCM_NONCE_SIZE), nullptr) != 1) {
        return fail(ErrorCode::CipherInitFailed, "set nonce length");
    }

    if (EVP_DecryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return fail(ErrorCode::CipherInitFailed, "set key and nonce");
    }

    // GCM is a stream mode: plaintext is exactly as long as the ciphertext.
    // One spare byte keeps data() valid for an empty message.
    ByteBuffer plaintext(ciphertext.size() + 1);
    int len = 0;
    int plaintext_len = 0;

    if (!ciphertext.empty()) {
        if (EVP_DecryptUpdate(ctx.get(), plaintext.data(), &len,
                              ciphertext.data(), static_cast<int>(ciphertext.size())) != 1) {
            return fail(ErrorCode::CipherUpdateFailed, "decrypt ciphertext");
        }
        plaintext_len = len;
    }

    // The expected tag must be set before EVP_DecryptFinal_ex
    // OpenSSL takes a non-const pointer here but does not modify the tag
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_TAG,
                            static_cast<int>(constants::AES_GCM_TAG_SIZE),
                            const_cast<Byte*>(tag.data())) != 1) {
        return fail(ErrorCode::CipherInitFailed, "set authentication tag");
    }

    // EVP_DecryptFinal_ex returns <= 0 when the tag does not match.
    // The partially decrypted buffer is discarded in that case.
    if (EVP_DecryptFinal_ex(ctx.get(), plaintext.data() + plaintext_len, &len) <= 0) {
        secure_zero(plaintext);
        return fail(ErrorCode::DecryptionAuthFailure,
                    "GCM tag check failed (wrong secret, or the payload was modified)");
    }

    plaintext_len += len;
    plaintext.resize(static_cast<std::size_t>(plaintext_len));

    return plaintext;
}

// ============================================================================
// Binary Decryption
// ============================================================================

Result<ByteBuffer> PayloadDecryptor::decrypt(ByteSpan payload, ByteSpan key) {
    // Too short to hold a nonce and a tag, whatever the key
    if (payload.size() < constants::MIN_PAYLOAD_SIZE) {
        return fail(ErrorCode::MalformedPayload,
                    std::format("payload is {} bytes, at least {} (nonce + tag) required",
                                payload.size(), constants::MIN_PAYLOAD_SIZE));
    }

    if (!KeyReconstructor::is_valid_share_size(key)) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("decryption key is {} bytes, expected {}",
                                key.size(), constants::AES_KEY_SIZE));
    }

    // [nonce (12 bytes)] + [encrypted data] + [tag (16 bytes)]
    ByteSpan nonce = payload.subspan(0, constants::AES_GCM_NONCE_SIZE);
    ByteSpan tag = payload.subspan(payload.size() - constants::AES_GCM_TAG_SIZE);
    std::size_t encrypted_size = payload.size() - constants::MIN_PAYLOAD_SIZE;
    ByteSpan encrypted_data = payload.subspan(constants::AES_GCM_NONCE_SIZE, encrypted_size);

    return decrypt_impl(encrypted_data, key, nonce, tag);
}

// ============================================================================
// Text Decryption
// ============================================================================

Result<std::string> PayloadDecryptor::decrypt_text(ByteSpan payload, ByteSpan key) {
    auto result = decrypt(payload, key);
    if (!result) {
        return std::unexpected(result.error());
    }

    if (!encoding::is_valid_utf8(*result)) {
        return fail(ErrorCode::EncodingError,
                    std::format("{} authentic bytes do not decode as UTF-8", result->size()));
    }

    return std::string(reinterpret_cast<const char*>(result->data()), result->size());
}

Result<std::string> PayloadDecryptor::decrypt_hex(std::string_view payload_hex, ByteSpan key) {
    auto payload = encoding::hex_decode(payload_hex);
    if (!payload) {
        return fail(ErrorCode::MalformedInput,
                    std::format("encryptedPayload: {}", payload.error().detail));
    }

    return decrypt_text(*payload, key);
}

} // namespace farewell
