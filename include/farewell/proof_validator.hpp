// ============================================================================
// Farewell - Proof Validator
// ============================================================================
// Structural check of a delivery proof before it is submitted. Input may be
// any JSON at all, so a failed check is an ordinary verdict, never an error:
// the result says whether the document is submittable and, if not, names the
// first offending field (and recipient index).
//
// Only shapes and JSON types are checked. Whether the numbers are valid field
// elements, or form a valid proof, is for the on-chain verifier.
// ============================================================================

#ifndef FAREWELL_PROOF_VALIDATOR_HPP
#define FAREWELL_PROOF_VALIDATOR_HPP

#include "delivery_proof.hpp"
#include "json.hpp"

#include <string>
#include <string_view>
#include <utility>

namespace farewell {

/// Verdict of ProofValidator: valid, or the reason it is not
struct ValidationResult {
    bool valid = false;
    std::string error;

    [[nodiscard]] explicit operator bool() const noexcept { return valid; }

    [[nodiscard]] static ValidationResult success() { return {true, {}}; }
    [[nodiscard]] static ValidationResult failure(std::string reason) {
        return {false, std::move(reason)};
    }
};

/// Shape validation of delivery-proof envelopes
class ProofValidator {
public:
    ProofValidator() = default;
    ~ProofValidator() = default;

    // Stateless
    ProofValidator(const ProofValidator&) = delete;
    ProofValidator& operator=(const ProofValidator&) = delete;
    ProofValidator(ProofValidator&&) = delete;
    ProofValidator& operator=(ProofValidator&&) = delete;

    /// Validate a parsed JSON document
    [[nodiscard]] static ValidationResult validate(json_object* document);

    /// Validate JSON text; unparseable text is an invalid proof
    [[nodiscard]] static ValidationResult validate_json(std::string_view text);

    /// Validate an envelope built in-process, as it will be serialized
    [[nodiscard]] static ValidationResult validate(const DeliveryProof& proof);
};

} // namespace farewell

#endif // FAREWELL_PROOF_VALIDATOR_HPP
