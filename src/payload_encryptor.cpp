// ============================================================================
// Farewell - Payload Encryptor Implementation
// ============================================================================

#include "farewell/payload_encryptor.hpp"
#include "farewell/encoding.hpp"
#include "farewell/key_reconstructor.hpp"

// OpenSSL headers
#include <openssl/evp.h>
#include <openssl/rand.h>

// Standard library
#include <algorithm>
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
// Encryption
// ============================================================================

Result<ByteBuffer> PayloadEncryptor::encrypt_with_nonce(
    ByteSpan plaintext,
    ByteSpan key,
    ByteSpan nonce
) {
    if (!KeyReconstructor::is_valid_share_size(key)) {
        return fail(ErrorCode::KeyLengthMismatch,
                    std::format("encryption key is {} bytes, expected {}",
                                key.size(), constants::AES_KEY_SIZE));
    }

    if (nonce.size() != constants::AES_GCM_NONCE_SIZE) {
        return fail(ErrorCode::InvalidArgument,
                    std::format("nonce is {} bytes, expected {}",
                                nonce.size(), constants::AES_GCM_NONCE_SIZE));
    }

    UniqueCipherCtx ctx(EVP_CIPHER_CTX_new());
    if (!ctx) {
        return fail(ErrorCode::CipherInitFailed, "EVP_CIPHER_CTX_new");
    }

    if (EVP_EncryptInit_ex(ctx.get(), EVP_aes_128_gcm(), nullptr, nullptr, nullptr) != 1) {
        return fail(ErrorCode::CipherInitFailed, "AES-128-GCM init");
    }

    // Nonce length must be set before the key and nonce
    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_SET_IVLEN,
                            static_cast<int>(constants::AES_GCM_NONCE_SIZE), nullptr) != 1) {
        return fail(ErrorCode::CipherInitFailed, "set nonce length");
    }

    if (EVP_EncryptInit_ex(ctx.get(), nullptr, nullptr, key.data(), nonce.data()) != 1) {
        return fail(ErrorCode::CipherInitFailed, "set key and nonce");
    }

    // Output layout: [nonce][ciphertext][tag]
    ByteBuffer output(constants::AES_GCM_NONCE_SIZE + plaintext.size() + constants::AES_GCM_TAG_SIZE);
    std::copy(nonce.begin(), nonce.end(), output.begin());

    Byte* ciphertext = output.data() + constants::AES_GCM_NONCE_SIZE;
    int len = 0;
    int ciphertext_len = 0;

    if (!plaintext.empty()) {
        if (EVP_EncryptUpdate(ctx.get(), ciphertext, &len,
                              plaintext.data(), static_cast<int>(plaintext.size())) != 1) {
            return fail(ErrorCode::CipherUpdateFailed, "encrypt plaintext");
        }
        ciphertext_len = len;
    }

    // For GCM this writes no more ciphertext but computes the tag
    if (EVP_EncryptFinal_ex(ctx.get(), ciphertext + ciphertext_len, &len) != 1) {
        return fail(ErrorCode::CipherFinalizeFailed, "finalize");
    }
    ciphertext_len += len;

    if (static_cast<std::size_t>(ciphertext_len) != plaintext.size()) {
        return fail(ErrorCode::CipherFinalizeFailed,
                    std::format("ciphertext length {} differs from plaintext length {}",
                                ciphertext_len, plaintext.size()));
    }

    if (EVP_CIPHER_CTX_ctrl(ctx.get(), EVP_CTRL_GCM_GET_TAG,
                            static_cast<int>(constants::AES_GCM_TAG_SIZE),
                            ciphertext + ciphertext_len) != 1) {
        return fail(ErrorCode::CipherFinalizeFailed, "read authentication tag");
    }

    return output;
}

Result<ByteBuffer> PayloadEncryptor::encrypt(ByteSpan plaintext, ByteSpan key) {
    auto nonce = generate_nonce();
    if (!nonce) {
        return std::unexpected(nonce.error());
    }

    return encrypt_with_nonce(plaintext, key, *nonce);
}

Result<ByteBuffer> PayloadEncryptor::encrypt_text(std::string_view plaintext, ByteSpan key) {
    return encrypt(encoding::as_bytes(plaintext), key);
}

// ============================================================================
// Random Generation
// ============================================================================

Result<SecureBuffer> PayloadEncryptor::generate_key() {
    SecureBuffer key(constants::AES_KEY_SIZE);

    // RAND_bytes returns 1 on success, 0 or -1 on failure
    if (RAND_bytes(key.data(), static_cast<int>(key.size())) != 1) {
        return fail(ErrorCode::RandomGenerationFailed, "key");
    }

    return key;
}

Result<ByteBuffer> PayloadEncryptor::generate_nonce() {
    ByteBuffer nonce(constants::AES_GCM_NONCE_SIZE);

    if (RAND_bytes(nonce.data(), static_cast<int>(nonce.size())) != 1) {
        return fail(ErrorCode::RandomGenerationFailed, "nonce");
    }

    return nonce;
}

} // namespace farewell
