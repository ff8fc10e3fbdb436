// ============================================================================
// Farewell - Claim Package Parser Implementation
// ============================================================================

#include "farewell/claim_parser.hpp"
#include "farewell/encoding.hpp"
#include "farewell/file_io.hpp"
#include "farewell/key_reconstructor.hpp"
#include "farewell/payload_decryptor.hpp"
#include "farewell/recipient_commitment.hpp"

// json-c
#include <json-c/json.h>

// Standard library
#include <format>
#include <set>

namespace farewell {

namespace {

template <typename... Ts>
struct Overloaded : Ts... {
    using Ts::operator()...;
};

Result<std::string> required_string(json_object* document, const char* key) {
    auto node = json::find(document, key);
    if (!node) {
        return fail(ErrorCode::MissingField, key);
    }
    if (!json::is_string(*node)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("{} must be a string, not {}", key, json::type_name(*node)));
    }
    return std::string(json::string_value(*node));
}

Result<std::optional<std::string>> optional_string(json_object* document, const char* key) {
    auto node = json::find(document, key);
    if (!node) {
        return std::optional<std::string>{};
    }
    if (!json::is_string(*node)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("{} must be a string, not {}", key, json::type_name(*node)));
    }
    return std::optional<std::string>{std::string(json::string_value(*node))};
}

Result<std::vector<std::string>> read_recipients(json_object* document) {
    auto node = json::find(document, "recipients");
    if (!node) {
        return fail(ErrorCode::MissingField, "recipients");
    }
    if (!json::is_array(*node)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("recipients must be an array of addresses, not {}",
                                json::type_name(*node)));
    }

    std::vector<std::string> recipients;
    const std::size_t count = json_object_array_length(*node);
    for (std::size_t i = 0; i < count; ++i) {
        json_object* element = json_object_array_get_idx(*node, i);
        if (!json::is_string(element)) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipients[{}] must be a string, not {}",
                                    i, json::type_name(element)));
        }
        recipients.emplace_back(json::string_value(element));
    }
    return recipients;
}

Result<std::string> read_content_hash(json_object* document) {
    auto hash = required_string(document, "contentHash");
    if (!hash) {
        return std::unexpected(hash.error());
    }
    if (!encoding::is_hex_string(*hash)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("contentHash '{}' is not a hex string", *hash));
    }
    return hash;
}

Result<std::optional<std::uint64_t>> read_message_index(json_object* document) {
    auto node = json::find(document, "messageIndex");
    if (!node) {
        return std::optional<std::uint64_t>{};
    }

    auto value = json::as_uint64(*node);
    if (!value) {
        return fail(ErrorCode::MalformedInput,
                    std::format("messageIndex must be a non-negative integer, not {}",
                                json::type_name(*node)));
    }
    return std::optional<std::uint64_t>{*value};
}

VoidResult validate_recipients(const std::vector<std::string>& recipients) {
    if (recipients.empty()) {
        return fail(ErrorCode::MalformedInput, "recipients is empty");
    }

    std::set<std::string> seen;
    for (std::size_t i = 0; i < recipients.size(); ++i) {
        if (!ClaimParser::is_valid_address(recipients[i])) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipients[{}] '{}' is not a valid email address",
                                    i, recipients[i]));
        }
        if (!seen.insert(RecipientCommitment::normalize(recipients[i])).second) {
            return fail(ErrorCode::MalformedInput,
                        std::format("recipients[{}] '{}' is listed more than once",
                                    i, recipients[i]));
        }
    }
    return {};
}

Result<ClaimInput> parse_claim_package(json_object* document) {
    ClaimPackage package;

    auto recipients = read_recipients(document);
    if (!recipients) return std::unexpected(recipients.error());
    package.recipients = std::move(*recipients);

    auto content_hash = read_content_hash(document);
    if (!content_hash) return std::unexpected(content_hash.error());
    package.content_hash = std::move(*content_hash);

    auto key_share = optional_string(document, "skShare");
    if (!key_share) return std::unexpected(key_share.error());
    package.key_share = std::move(*key_share);

    auto payload = optional_string(document, "encryptedPayload");
    if (!payload) return std::unexpected(payload.error());
    package.encrypted_payload = std::move(*payload);

    auto subject = optional_string(document, "subject");
    if (!subject) return std::unexpected(subject.error());
    package.subject = std::move(*subject);

    auto owner = optional_string(document, "owner");
    if (!owner) return std::unexpected(owner.error());
    package.owner = std::move(*owner);

    auto message_index = read_message_index(document);
    if (!message_index) return std::unexpected(message_index.error());
    package.message_index = *message_index;

    if (auto valid = validate_recipients(package.recipients); !valid) {
        return std::unexpected(valid.error());
    }

    return ClaimInput{std::move(package)};
}

Result<ClaimInput> parse_direct_message(json_object* document) {
    DirectMessage direct;

    auto recipients = read_recipients(document);
    if (!recipients) return std::unexpected(recipients.error());
    direct.recipients = std::move(*recipients);

    auto content_hash = read_content_hash(document);
    if (!content_hash) return std::unexpected(content_hash.error());
    direct.content_hash = std::move(*content_hash);

    auto message = required_string(document, "message");
    if (!message) return std::unexpected(message.error());
    direct.message = std::move(*message);

    auto subject = optional_string(document, "subject");
    if (!subject) return std::unexpected(subject.error());
    direct.subject = std::move(*subject);

    if (auto valid = validate_recipients(direct.recipients); !valid) {
        return std::unexpected(valid.error());
    }

    return ClaimInput{std::move(direct)};
}

Result<MessageData> normalize_claim_package(const ClaimPackage& package, const ClaimOptions& options) {
    MessageData data;
    data.recipients = package.recipients;
    data.content_hash = package.content_hash;
    data.subject = package.subject.value_or(std::string(DEFAULT_SUBJECT));
    data.owner = package.owner;
    data.message_index = package.message_index;

    if (options.mode() == DecryptionMode::Deferred) {
        data.body = std::string(DEFERRED_BODY_PLACEHOLDER);
        data.source = BodySource::Deferred;
        return data;
    }

    if (!package.key_share) {
        return fail(ErrorCode::MissingField, "skShare (needed to decrypt with the supplied secret)");
    }
    if (!package.encrypted_payload) {
        return fail(ErrorCode::MissingField, "encryptedPayload (needed to decrypt with the supplied secret)");
    }

    auto key = KeyReconstructor::reconstruct_hex(*package.key_share, *options.secret_hex);
    if (!key) {
        return std::unexpected(key.error());
    }

    auto body = PayloadDecryptor::decrypt_hex(*package.encrypted_payload, key->span());
    if (!body) {
        return std::unexpected(body.error());
    }

    data.body = std::move(*body);
    data.source = BodySource::Decrypted;
    return data;
}

Result<MessageData> normalize_direct_message(const DirectMessage& direct) {
    MessageData data;
    data.recipients = direct.recipients;
    data.content_hash = direct.content_hash;
    data.body = direct.message;
    data.subject = direct.subject.value_or(std::string(DEFAULT_SUBJECT));
    data.source = BodySource::Direct;
    return data;
}

} // anonymous namespace

// ============================================================================
// Parsing
// ============================================================================

Result<ClaimInput> ClaimParser::parse(std::string_view text) {
    auto document = json::parse(text);
    if (!document) {
        return std::unexpected(document.error());
    }

    return parse_document(document->get());
}

Result<ClaimInput> ClaimParser::parse_document(json_object* document) {
    if (!json::is_object(document)) {
        return fail(ErrorCode::MalformedInput,
                    std::format("input must be a JSON object, not {}", json::type_name(document)));
    }

    auto type = json::find(document, "type");
    if (type && json::is_string(*type) && json::string_value(*type) == constants::CLAIM_PACKAGE_TYPE) {
        return parse_claim_package(document);
    }
    return parse_direct_message(document);
}

// ============================================================================
// Normalization
// ============================================================================

Result<MessageData> ClaimParser::normalize(const ClaimInput& input, const ClaimOptions& options) {
    return std::visit(Overloaded{
        [&](const ClaimPackage& package) -> Result<MessageData> {
            if (auto valid = validate_recipients(package.recipients); !valid) {
                return std::unexpected(valid.error());
            }
            return normalize_claim_package(package, options);
        },
        [](const DirectMessage& direct) -> Result<MessageData> {
            if (auto valid = validate_recipients(direct.recipients); !valid) {
                return std::unexpected(valid.error());
            }
            return normalize_direct_message(direct);
        },
    }, input);
}

Result<MessageData> ClaimParser::load(std::string_view text, const ClaimOptions& options) {
    auto input = parse(text);
    if (!input) {
        return std::unexpected(input.error());
    }
    return normalize(*input, options);
}

Result<MessageData> ClaimParser::load_file(
    const std::filesystem::path& path,
    const ClaimOptions& options
) {
    auto text = read_text_file(path);
    if (!text) {
        return std::unexpected(text.error());
    }
    return load(*text, options);
}

// ============================================================================
// Validation
// ============================================================================

bool ClaimParser::is_valid_address(std::string_view address) noexcept {
    if (address.empty()) {
        return false;
    }

    auto is_space = [](char c) {
        return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
    };
    if (is_space(address.front()) || is_space(address.back())) {
        return false;
    }

    return address.find('@') != std::string_view::npos;
}

} // namespace farewell
