// ============================================================================
// Farewell - Proof Validator Implementation
// ============================================================================

#include "farewell/proof_validator.hpp"
#include "farewell/encoding.hpp"
#include "farewell/proof_assembler.hpp"
#include "farewell/types.hpp"

// json-c
#include <json-c/json.h>

// Standard library
#include <algorithm>
#include <format>

namespace farewell {

namespace {

bool is_decimal(std::string_view text) {
    return !text.empty() &&
           std::all_of(text.begin(), text.end(), [](char c) { return c >= '0' && c <= '9'; });
}

// Field elements arrive as decimal strings, 0x-prefixed hex strings or
// non-negative JSON integers
bool is_numeric(json_object* value) {
    if (json::as_uint64(value)) {
        return true;
    }
    if (!json::is_string(value)) {
        return false;
    }
    std::string_view text = json::string_value(value);
    if (text.starts_with("0x") || text.starts_with("0X")) {
        return encoding::is_hex_string(text);
    }
    return is_decimal(text);
}

/// Empty string when `node` is an array of exactly `size` numeric elements
std::string check_numeric_array(json_object* node, const std::string& name, std::size_t size) {
    if (!json::is_array(node)) {
        return std::format("{} must be an array, not {}", name, json::type_name(node));
    }
    const std::size_t length = json_object_array_length(node);
    if (length != size) {
        return std::format("{} must have exactly {} elements (found {})", name, size, length);
    }
    for (std::size_t i = 0; i < length; ++i) {
        json_object* element = json_object_array_get_idx(node, i);
        if (!is_numeric(element)) {
            return std::format("{}[{}] must be a numeric string, not {}",
                               name, i, json::type_name(element));
        }
    }
    return {};
}

std::string check_recipient_proof(json_object* proof, std::size_t index) {
    const std::string prefix = std::format("recipientProofs[{}]", index);

    if (!json::is_object(proof)) {
        return std::format("{} must be an object, not {}", prefix, json::type_name(proof));
    }

    if (auto recipient_index = json::find(proof, "recipientIndex")) {
        if (!json::as_uint64(*recipient_index)) {
            return std::format("{}.recipientIndex must be a non-negative integer", prefix);
        }
    }

    if (auto recipient_hash = json::find(proof, "recipientHash")) {
        std::string_view text = json::string_value(*recipient_hash);
        if (!json::is_string(*recipient_hash) || !text.starts_with("0x") || !encoding::is_hex_string(text)) {
            return std::format("{}.recipientHash must be a 0x-prefixed hex string", prefix);
        }
    }

    // pA: 2 elements
    auto p_a = json::find(proof, "pA");
    if (!p_a) {
        return std::format("{}.pA is missing", prefix);
    }
    if (auto error = check_numeric_array(*p_a, prefix + ".pA", 2); !error.empty()) {
        return error;
    }

    // pB: 2 rows of 2 elements
    auto p_b = json::find(proof, "pB");
    if (!p_b) {
        return std::format("{}.pB is missing", prefix);
    }
    if (!json::is_array(*p_b)) {
        return std::format("{}.pB must be an array of 2 rows, not {}", prefix, json::type_name(*p_b));
    }
    const std::size_t rows = json_object_array_length(*p_b);
    if (rows != 2) {
        return std::format("{}.pB must have exactly 2 rows (found {})", prefix, rows);
    }
    for (std::size_t row = 0; row < rows; ++row) {
        auto error = check_numeric_array(json_object_array_get_idx(*p_b, row),
                                         std::format("{}.pB[{}]", prefix, row), 2);
        if (!error.empty()) {
            return error;
        }
    }

    // pC: 2 elements
    auto p_c = json::find(proof, "pC");
    if (!p_c) {
        return std::format("{}.pC is missing", prefix);
    }
    if (auto error = check_numeric_array(*p_c, prefix + ".pC", 2); !error.empty()) {
        return error;
    }

    // publicSignals: non-empty, length is the circuit's business
    auto signals = json::find(proof, "publicSignals");
    if (!signals) {
        return std::format("{}.publicSignals is missing", prefix);
    }
    if (!json::is_array(*signals) || json_object_array_length(*signals) == 0) {
        return std::format("{}.publicSignals must be a non-empty array", prefix);
    }
    if (auto error = check_numeric_array(*signals, prefix + ".publicSignals",
                                         json_object_array_length(*signals));
        !error.empty()) {
        return error;
    }

    return {};
}

} // anonymous namespace

ValidationResult ProofValidator::validate(json_object* document) {
    if (!json::is_object(document)) {
        return ValidationResult::failure(
            std::format("delivery proof must be a JSON object, not {}", json::type_name(document)));
    }

    // Envelope markers are optional, but must be right when present
    if (auto type = json::find(document, "type")) {
        if (!json::is_string(*type) || json::string_value(*type) != constants::DELIVERY_PROOF_TYPE) {
            return ValidationResult::failure(std::format(
                "type must be the string '{}'", constants::DELIVERY_PROOF_TYPE));
        }
    }
    if (auto version = json::find(document, "version")) {
        auto number = json::as_uint64(*version);
        if (!number || *number != static_cast<std::uint64_t>(constants::DELIVERY_PROOF_VERSION)) {
            return ValidationResult::failure(std::format(
                "version must be the integer {}", constants::DELIVERY_PROOF_VERSION));
        }
    }

    auto owner = json::find(document, "owner");
    if (!owner) {
        return ValidationResult::failure("missing required field 'owner'");
    }
    if (!json::is_string(*owner) || json::string_value(*owner).empty()) {
        return ValidationResult::failure(std::format(
            "owner must be a non-empty string (found {})", json::type_name(*owner)));
    }

    auto message_index = json::find(document, "messageIndex");
    if (!message_index) {
        return ValidationResult::failure("missing required field 'messageIndex'");
    }
    if (!json::as_uint64(*message_index)) {
        return ValidationResult::failure(std::format(
            "messageIndex must be a non-negative integer (found {})", json::type_name(*message_index)));
    }

    auto proofs = json::find(document, "recipientProofs");
    if (!proofs) {
        return ValidationResult::failure("missing required field 'recipientProofs'");
    }
    if (!json::is_array(*proofs) || json_object_array_length(*proofs) == 0) {
        return ValidationResult::failure("recipientProofs must be a non-empty array");
    }

    const std::size_t count = json_object_array_length(*proofs);
    for (std::size_t i = 0; i < count; ++i) {
        if (auto error = check_recipient_proof(json_object_array_get_idx(*proofs, i), i); !error.empty()) {
            return ValidationResult::failure(std::move(error));
        }
    }

    return ValidationResult::success();
}

ValidationResult ProofValidator::validate_json(std::string_view text) {
    auto document = json::parse(text);
    if (!document) {
        return ValidationResult::failure(document.error().detail);
    }
    return validate(document->get());
}

ValidationResult ProofValidator::validate(const DeliveryProof& proof) {
    return validate(ProofAssembler::to_document(proof).get());
}

} // namespace farewell
