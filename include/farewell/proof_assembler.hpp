// ============================================================================
// Farewell - Proof Assembler
// ============================================================================
// Builds the delivery-proof envelope from the messages actually sent:
//
// 1. assemble()        one RecipientProof per (recipient, sent message)
// 2. build_envelope()  wrap the proofs with the owner and message index
// 3. to_json()         render the envelope for submission
//
// Public signals follow the circuit's input order:
//   [0] recipient commitment
//   [1] hash of the DKIM key record that signed the sent message
//   [2] content hash, passed through unchanged
//
// The Groth16 points are produced by an external prover. Until then pA, pB
// and pC hold "0" placeholders of the correct shape.
// ============================================================================

#ifndef FAREWELL_PROOF_ASSEMBLER_HPP
#define FAREWELL_PROOF_ASSEMBLER_HPP

#include "delivery_proof.hpp"
#include "json.hpp"
#include "message.hpp"
#include "types.hpp"

#include <cstdint>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace farewell {

/// Assembles recipient proofs and delivery-proof envelopes
class ProofAssembler {
public:
    ProofAssembler() = default;
    ~ProofAssembler() = default;

    // Stateless
    ProofAssembler(const ProofAssembler&) = delete;
    ProofAssembler& operator=(const ProofAssembler&) = delete;
    ProofAssembler(ProofAssembler&&) = delete;
    ProofAssembler& operator=(ProofAssembler&&) = delete;

    // ========================================================================
    // Recipient Proofs
    // ========================================================================

    /// Build the proof for one recipient
    /// @param content_hash The message's content commitment (hex)
    /// @param recipient The recipient's address
    /// @param sent_message Raw text (headers + body) of the message sent to them
    /// @param recipient_index Position of the recipient in the message's recipient list
    /// @return The proof, or MalformedInput naming the bad argument
    [[nodiscard]] static Result<RecipientProof> assemble(
        std::string_view content_hash,
        std::string_view recipient,
        std::string_view sent_message,
        std::size_t recipient_index = 0
    );

    /// Build the proofs for every recipient of a message, in recipient order
    /// @param sent_messages One raw message per recipient, same order
    /// @return The proofs, or RecipientCountMismatch
    [[nodiscard]] static Result<std::vector<RecipientProof>> assemble_all(
        const MessageData& message,
        std::span<const std::string> sent_messages
    );

    // ========================================================================
    // Envelope
    // ========================================================================

    /// Wrap recipient proofs into a delivery proof
    /// @param expected_recipients Number of recipients of the source message
    /// @return The envelope, or RecipientCountMismatch / MissingField /
    ///         MalformedInput (duplicate or out-of-order recipients)
    [[nodiscard]] static Result<DeliveryProof> build_envelope(
        std::string_view owner,
        std::uint64_t message_index,
        std::vector<RecipientProof> proofs,
        std::size_t expected_recipients
    );

    /// assemble_all() followed by build_envelope()
    [[nodiscard]] static Result<DeliveryProof> prove(
        const MessageData& message,
        std::span<const std::string> sent_messages,
        std::string_view owner,
        std::uint64_t message_index
    );

    // ========================================================================
    // Rendering
    // ========================================================================

    /// The envelope as a JSON document
    [[nodiscard]] static json::Object to_document(const DeliveryProof& proof);

    /// The envelope as indented JSON text
    [[nodiscard]] static std::string to_json(const DeliveryProof& proof);

    // ========================================================================
    // Signals
    // ========================================================================

    /// Hash of "<selector>._domainkey.<domain>" from the DKIM-Signature header,
    /// or 32 zero bytes (hex) when the message is not DKIM-signed
    [[nodiscard]] static Result<std::string> dkim_key_signal(std::string_view sent_message);
};

} // namespace farewell

#endif // FAREWELL_PROOF_ASSEMBLER_HPP
