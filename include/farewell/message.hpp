// ============================================================================
// Farewell - Message Model
// ============================================================================
// The two accepted input shapes and the normalized message they produce:
//
//   ClaimPackage  {"type":"farewell-claim-package", recipients, skShare,
//                  encryptedPayload, contentHash, subject?, owner?, messageIndex?}
//   DirectMessage {recipients, contentHash, message, subject?}
//
// ClaimInput is the tagged union of the two; ClaimParser matches on it
// exhaustively to build a MessageData.
// ============================================================================

#ifndef FAREWELL_MESSAGE_HPP
#define FAREWELL_MESSAGE_HPP

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace farewell {

/// Export of an on-chain message claim: encrypted body plus half of its key
struct ClaimPackage {
    std::vector<std::string> recipients;
    std::string content_hash;
    std::optional<std::string> key_share;          // skShare, hex
    std::optional<std::string> encrypted_payload;  // [nonce][ciphertext][tag], hex
    std::optional<std::string> subject;
    std::optional<std::string> owner;
    std::optional<std::uint64_t> message_index;
};

/// Legacy shape: the plaintext travels in the clear
struct DirectMessage {
    std::vector<std::string> recipients;
    std::string content_hash;
    std::string message;
    std::optional<std::string> subject;
};

using ClaimInput = std::variant<ClaimPackage, DirectMessage>;

/// Where the body of a MessageData came from
enum class BodySource {
    Direct,     // DirectMessage.message
    Decrypted,  // Claim package decrypted locally with the off-chain secret
    Deferred,   // Placeholder; the recipient decrypts with the external decrypter
};

[[nodiscard]] constexpr std::string_view body_source_to_string(BodySource source) noexcept {
    switch (source) {
        case BodySource::Direct: return "direct";
        case BodySource::Decrypted: return "decrypted";
        case BodySource::Deferred: return "deferred";
    }
    return "unknown";
}

/// A message ready to be composed and sent to its recipients
struct MessageData {
    std::vector<std::string> recipients;
    std::string content_hash;
    std::string body;
    std::string subject;
    BodySource source = BodySource::Direct;

    // Identify the on-chain message; only claim packages carry them
    std::optional<std::string> owner;
    std::optional<std::uint64_t> message_index;
};

} // namespace farewell

#endif // FAREWELL_MESSAGE_HPP
