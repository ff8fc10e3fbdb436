// ============================================================================
// Farewell - Proof Assembler Implementation
// ============================================================================

#include "farewell/proof_assembler.hpp"
#include "farewell/claim_parser.hpp"
#include "farewell/encoding.hpp"
#include "farewell/recipient_commitment.hpp"
#include "farewell/version.hpp"

// json-c
#include <json-c/json.h>

// Standard library
#include <format>
#include <optional>
#include <set>

namespace farewell {

namespace {

/// Value written into proof points until the external prover fills them
constexpr const char* PLACEHOLDER_POINT = "0";

bool is_space(char c) noexcept {
    return c == ' ' || c == '\t' || c == '\r' || c == '\n';
}

std::string_view trim(std::string_view text) noexcept {
    while (!text.empty() && is_space(text.front())) text.remove_prefix(1);
    while (!text.empty() && is_space(text.back())) text.remove_suffix(1);
    return text;
}

bool iequals(std::string_view a, std::string_view b) noexcept {
    if (a.size() != b.size()) {
        return false;
    }
    for (std::size_t i = 0; i < a.size(); ++i) {
        char ca = (a[i] >= 'A' && a[i] <= 'Z') ? static_cast<char>(a[i] - 'A' + 'a') : a[i];
        char cb = (b[i] >= 'A' && b[i] <= 'Z') ? static_cast<char>(b[i] - 'A' + 'a') : b[i];
        if (ca != cb) {
            return false;
        }
    }
    return true;
}

// Header block of an RFC 5322 message with folded lines joined
std::vector<std::string> unfold_headers(std::string_view message) {
    std::vector<std::string> headers;
    std::size_t pos = 0;

    while (pos < message.size()) {
        std::size_t eol = message.find('\n', pos);
        std::string_view line = message.substr(pos, eol == std::string_view::npos ? std::string_view::npos : eol - pos);
        pos = eol == std::string_view::npos ? message.size() : eol + 1;

        if (!line.empty() && line.back() == '\r') {
            line.remove_suffix(1);
        }
        if (line.empty()) {
            break;  // End of headers
        }

        if ((line.front() == ' ' || line.front() == '\t') && !headers.empty()) {
            headers.back() += ' ';
            headers.back() += trim(line);
        } else {
            headers.emplace_back(line);
        }
    }
    return headers;
}

struct DkimKeyRecord {
    std::string selector;
    std::string domain;
};

std::optional<DkimKeyRecord> find_dkim_key_record(std::string_view message) {
    for (const std::string& header : unfold_headers(message)) {
        std::string_view view = header;
        std::size_t colon = view.find(':');
        if (colon == std::string_view::npos || !iequals(trim(view.substr(0, colon)), "DKIM-Signature")) {
            continue;
        }

        DkimKeyRecord record;
        std::string_view tags = view.substr(colon + 1);
        while (!tags.empty()) {
            std::size_t semicolon = tags.find(';');
            std::string_view tag = tags.substr(0, semicolon);
            tags = semicolon == std::string_view::npos ? std::string_view{} : tags.substr(semicolon + 1);

            std::size_t equals = tag.find('=');
            if (equals == std::string_view::npos) {
                continue;
            }
            std::string_view name = trim(tag.substr(0, equals));

            // Tag values may contain folding whitespace; drop it
            std::string value;
            for (char c : tag.substr(equals + 1)) {
                if (!is_space(c)) value += c;
            }

            if (name == "s") record.selector = std::move(value);
            else if (name == "d") record.domain = std::move(value);
        }

        if (!record.selector.empty() && !record.domain.empty()) {
            return record;
        }
    }
    return std::nullopt;
}

json_object* new_string(std::string_view value) {
    return json_object_new_string_len(value.data(), static_cast<int>(value.size()));
}

json_object* string_array(std::span<const std::string> values) {
    json_object* array = json_object_new_array();
    for (const std::string& value : values) {
        json_object_array_add(array, new_string(value));
    }
    return array;
}

} // anonymous namespace

// ============================================================================
// Signals
// ============================================================================

Result<std::string> ProofAssembler::dkim_key_signal(std::string_view sent_message) {
    auto record = find_dkim_key_record(sent_message);
    if (!record) {
        return encoding::hex_encode(ByteBuffer(constants::COMMITMENT_SIZE, 0));
    }

    std::string key_record = RecipientCommitment::normalize(
        std::format("{}._domainkey.{}", record->selector, record->domain));
    auto digest = RecipientCommitment::hash_bytes(encoding::as_bytes(key_record));
    if (!digest) {
        return std::unexpected(digest.error());
    }
    return encoding::hex_encode(*digest);
}

// ============================================================================
// Recipient Proofs
// ============================================================================

Result<RecipientProof> ProofAssembler::assemble(
    std::string_view content_hash,
    std::string_view recipient,
    std::string_view sent_message,
    std::size_t recipient_index
) {
    if (!encoding::is_hex_string(content_hash)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("contentHash '{}' is not a hex string", content_hash));
    }

    if (!ClaimParser::is_valid_address(trim(recipient))) {
        return fail(ErrorCode::MalformedInput,
                    std::format("recipient {} '{}' is not a valid email address",
                                recipient_index, recipient));
    }

    if (trim(sent_message).empty()) {
        return fail(ErrorCode::MalformedInput,
                    std::format("sent message for recipient {} is empty", recipient_index));
    }

    auto recipient_hash = RecipientCommitment::compute(recipient);
    if (!recipient_hash) {
        return std::unexpected(recipient_hash.error());
    }

    auto dkim_signal = dkim_key_signal(sent_message);
    if (!dkim_signal) {
        return std::unexpected(dkim_signal.error());
    }

    RecipientProof proof;
    proof.recipient_index = recipient_index;
    proof.email = RecipientCommitment::normalize(recipient);
    proof.recipient_hash = *recipient_hash;
    proof.p_a = {PLACEHOLDER_POINT, PLACEHOLDER_POINT};
    proof.p_b = {{{PLACEHOLDER_POINT, PLACEHOLDER_POINT}, {PLACEHOLDER_POINT, PLACEHOLDER_POINT}}};
    proof.p_c = {PLACEHOLDER_POINT, PLACEHOLDER_POINT};

    // Signals are 0x-hex; a bare-hex content hash gets the prefix
    std::string content_signal(content_hash);
    if (!content_hash.starts_with("0x") && !content_hash.starts_with("0X")) {
        content_signal.insert(0, "0x");
    }

    proof.public_signals = {
        std::move(*recipient_hash),
        std::move(*dkim_signal),
        std::move(content_signal),
    };

    return proof;
}

Result<std::vector<RecipientProof>> ProofAssembler::assemble_all(
    const MessageData& message,
    std::span<const std::string> sent_messages
) {
    if (sent_messages.size() != message.recipients.size()) {
        return fail(ErrorCode::RecipientCountMismatch,
                    std::format("{} sent messages for {} recipients",
                                sent_messages.size(), message.recipients.size()));
    }

    std::vector<RecipientProof> proofs;
    proofs.reserve(message.recipients.size());

    for (std::size_t i = 0; i < message.recipients.size(); ++i) {
        auto proof = assemble(message.content_hash, message.recipients[i], sent_messages[i], i);
        if (!proof) {
            return std::unexpected(proof.error());
        }
        proofs.push_back(std::move(*proof));
    }

    return proofs;
}

// ============================================================================
// Envelope
// ============================================================================

Result<DeliveryProof> ProofAssembler::build_envelope(
    std::string_view owner,
    std::uint64_t message_index,
    std::vector<RecipientProof> proofs,
    std::size_t expected_recipients
) {
    if (trim(owner).empty()) {
        return fail(ErrorCode::MissingField, "owner");
    }

    if (proofs.size() != expected_recipients) {
        return fail(ErrorCode::RecipientCountMismatch,
                    std::format("{} recipient proofs for {} recipients",
                                proofs.size(), expected_recipients));
    }

    std::set<std::string> seen;
    for (std::size_t i = 0; i < proofs.size(); ++i) {
        const RecipientProof& proof = proofs[i];

        if (proof.recipient_index != i) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipient proof at position {} has recipientIndex {}",
                                    i, proof.recipient_index));
        }
        if (proof.public_signals.empty()) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipient proof {} has no public signals", i));
        }
        if (!seen.insert(proof.recipient_hash).second) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipient proof {} duplicates an earlier recipient", i));
        }
    }

    DeliveryProof envelope;
    envelope.owner = std::string(owner);
    envelope.message_index = message_index;
    envelope.recipient_proofs = std::move(proofs);
    return envelope;
}

Result<DeliveryProof> ProofAssembler::prove(
    const MessageData& message,
    std::span<const std::string> sent_messages,
    std::string_view owner,
    std::uint64_t message_index
) {
    auto proofs = assemble_all(message, sent_messages);
    if (!proofs) {
        return std::unexpected(proofs.error());
    }
    return build_envelope(owner, message_index, std::move(*proofs), message.recipients.size());
}

// ============================================================================
// Rendering
// ============================================================================

json::Object ProofAssembler::to_document(const DeliveryProof& proof) {
    json::Object root(json_object_new_object());
    json_object_object_add(root.get(), "type", new_string(constants::DELIVERY_PROOF_TYPE));
    json_object_object_add(root.get(), "version", json_object_new_int(constants::DELIVERY_PROOF_VERSION));
    json_object_object_add(root.get(), "owner", new_string(proof.owner));
    json_object_object_add(root.get(), "messageIndex", json_object_new_uint64(proof.message_index));

    // json_object_object_add / json_object_array_add take ownership of the child
    json_object* recipient_proofs = json_object_new_array();
    for (const RecipientProof& recipient : proof.recipient_proofs) {
        json_object* entry = json_object_new_object();
        json_object_object_add(entry, "recipientIndex", json_object_new_uint64(recipient.recipient_index));
        json_object_object_add(entry, "email", new_string(recipient.email));
        json_object_object_add(entry, "recipientHash", new_string(recipient.recipient_hash));
        json_object_object_add(entry, "pA", string_array(recipient.p_a));

        json_object* p_b = json_object_new_array();
        for (const auto& row : recipient.p_b) {
            json_object_array_add(p_b, string_array(row));
        }
        json_object_object_add(entry, "pB", p_b);

        json_object_object_add(entry, "pC", string_array(recipient.p_c));
        json_object_object_add(entry, "publicSignals", string_array(recipient.public_signals));

        json_object_array_add(recipient_proofs, entry);
    }
    json_object_object_add(root.get(), "recipientProofs", recipient_proofs);

    json_object* metadata = json_object_new_object();
    json_object_object_add(metadata, "generator",
                           new_string(std::format("{}/{}", GENERATOR_NAME, VERSION_STRING)));
    json_object_object_add(metadata, "recipientCount",
                           json_object_new_uint64(proof.recipient_proofs.size()));
    json_object_object_add(root.get(), "metadata", metadata);

    return root;
}

std::string ProofAssembler::to_json(const DeliveryProof& proof) {
    return json::serialize(to_document(proof).get());
}

} // namespace farewell
