// ============================================================================
// Farewell - Delivery Proof Types
// ============================================================================
// The envelope submitted on-chain to prove a message reached its recipients.
// One RecipientProof per recipient, in the order of the message's recipient
// list. The Groth16 arrays have fixed shapes (pA: 2, pB: 2x2, pC: 2); they are
// std::arrays so an assembled proof cannot carry extra or missing elements.
// ============================================================================

#ifndef FAREWELL_DELIVERY_PROOF_HPP
#define FAREWELL_DELIVERY_PROOF_HPP

#include <array>
#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace farewell {

/// Proof that one recipient received the message
struct RecipientProof {
    std::size_t recipient_index = 0;
    std::string email;
    std::string recipient_hash;

    std::array<std::string, 2> p_a;
    std::array<std::array<std::string, 2>, 2> p_b;
    std::array<std::string, 2> p_c;

    /// Opaque circuit inputs; never empty once assembled
    std::vector<std::string> public_signals;
};

/// The delivery-proof envelope
struct DeliveryProof {
    std::string owner;
    std::uint64_t message_index = 0;
    std::vector<RecipientProof> recipient_proofs;
};

} // namespace farewell

#endif // FAREWELL_DELIVERY_PROOF_HPP
