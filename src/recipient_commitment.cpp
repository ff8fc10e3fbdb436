// ============================================================================
// Farewell - Recipient Commitment Implementation
// ============================================================================

#include "farewell/recipient_commitment.hpp"
#include "farewell/encoding.hpp"

// OpenSSL headers
#include <openssl/evp.h>

// Standard library
#include <memory>

namespace farewell {

namespace {

struct MdCtxDeleter {
    void operator()(EVP_MD_CTX* ctx) const { if (ctx) EVP_MD_CTX_free(ctx); }
};
using UniqueMdCtx = std::unique_ptr<EVP_MD_CTX, MdCtxDeleter>;

struct MdDeleter {
    void operator()(EVP_MD* md) const { if (md) EVP_MD_free(md); }
};
using UniqueMd = std::unique_ptr<EVP_MD, MdDeleter>;

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

} // anonymous namespace

std::string RecipientCommitment::normalize(std::string_view address) {
    while (!address.empty() && is_space(address.front())) {
        address.remove_prefix(1);
    }
    while (!address.empty() && is_space(address.back())) {
        address.remove_suffix(1);
    }

    std::string normalized(address);
    for (char& c : normalized) {
        if (c >= 'A' && c <= 'Z') {
            c = static_cast<char>(c - 'A' + 'a');
        }
    }
    return normalized;
}

Result<ByteBuffer> RecipientCommitment::hash_bytes(ByteSpan data) {
    UniqueMd md(EVP_MD_fetch(nullptr, constants::COMMITMENT_DIGEST, nullptr));
    if (!md) {
        return fail(ErrorCode::HashFailed, "digest unavailable");
    }

    UniqueMdCtx ctx(EVP_MD_CTX_new());
    if (!ctx) {
        return fail(ErrorCode::HashFailed, "EVP_MD_CTX_new");
    }

    ByteBuffer digest(constants::COMMITMENT_SIZE);
    unsigned int digest_len = 0;

    if (EVP_DigestInit_ex(ctx.get(), md.get(), nullptr) != 1 ||
        EVP_DigestUpdate(ctx.get(), data.data(), data.size()) != 1 ||
        EVP_DigestFinal_ex(ctx.get(), digest.data(), &digest_len) != 1) {
        return fail(ErrorCode::HashFailed, "digest computation");
    }

    if (digest_len != constants::COMMITMENT_SIZE) {
        return fail(ErrorCode::HashFailed, "unexpected digest length");
    }

    return digest;
}

Result<ByteBuffer> RecipientCommitment::digest(std::string_view address) {
    std::string normalized = normalize(address);
    return hash_bytes(encoding::as_bytes(normalized));
}

Result<std::string> RecipientCommitment::compute(std::string_view address) {
    auto raw = digest(address);
    if (!raw) {
        return std::unexpected(raw.error());
    }
    return encoding::hex_encode(*raw);
}

} // namespace farewell
