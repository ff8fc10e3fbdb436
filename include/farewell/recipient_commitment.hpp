// ============================================================================
// Farewell - Recipient Commitment
// ============================================================================
// The on-chain record stores a hash of each recipient's address rather than
// the address itself. A delivery proof must reproduce that hash exactly:
//
//     commitment = "0x" || hex( SHA-256( lower(trim(address)) ) )
//
// Addresses differing only in case or surrounding whitespace commit to the
// same value. The digest (constants::COMMITMENT_DIGEST) is pinned to the one
// used by the contract's verifier and must not change independently.
// ============================================================================

#ifndef FAREWELL_RECIPIENT_COMMITMENT_HPP
#define FAREWELL_RECIPIENT_COMMITMENT_HPP

#include "types.hpp"
#include <string>
#include <string_view>

namespace farewell {

/// Deterministic commitment to a recipient address
class RecipientCommitment {
public:
    RecipientCommitment() = default;
    ~RecipientCommitment() = default;

    // Stateless
    RecipientCommitment(const RecipientCommitment&) = delete;
    RecipientCommitment& operator=(const RecipientCommitment&) = delete;
    RecipientCommitment(RecipientCommitment&&) = delete;
    RecipientCommitment& operator=(RecipientCommitment&&) = delete;

    /// Trim surrounding whitespace and lower-case ASCII letters
    [[nodiscard]] static std::string normalize(std::string_view address);

    /// Raw 32-byte digest of the normalized address
    [[nodiscard]] static Result<ByteBuffer> digest(std::string_view address);

    /// Commitment as a 0x-prefixed, 64-digit lower-case hex string
    [[nodiscard]] static Result<std::string> compute(std::string_view address);

    /// Digest arbitrary text with the commitment hash (no normalization)
    [[nodiscard]] static Result<ByteBuffer> hash_bytes(ByteSpan data);
};

} // namespace farewell

#endif // FAREWELL_RECIPIENT_COMMITMENT_HPP
