// ============================================================================
// Farewell - Claim Package Parser
// ============================================================================
// Turns the JSON handed to the claimer into a MessageData.
//
// Dispatch is on the "type" field:
// - "farewell-claim-package" -> ClaimPackage (recipients, contentHash required)
// - absent or anything else  -> DirectMessage (recipients, contentHash, message)
//
// A claim package body is recovered according to ClaimOptions:
// - secret supplied  -> key = skShare XOR secret, body = decrypted payload
// - no secret        -> body = a placeholder pointing the recipient to the
//                       external decrypter (the payload is not touched)
// ============================================================================

#ifndef FAREWELL_CLAIM_PARSER_HPP
#define FAREWELL_CLAIM_PARSER_HPP

#include "message.hpp"
#include "json.hpp"
#include "types.hpp"

#include <filesystem>
#include <optional>
#include <string>
#include <string_view>

namespace farewell {

/// How claim-package bodies are recovered
enum class DecryptionMode {
    Local,     // Reconstruct the key and decrypt here
    Deferred,  // Leave decryption to the external decrypter
};

[[nodiscard]] constexpr std::string_view decryption_mode_to_string(DecryptionMode mode) noexcept {
    return mode == DecryptionMode::Local ? "local" : "deferred";
}

/// Parser configuration
struct ClaimOptions {
    /// Off-chain secret s' (hex). Its presence switches on local decryption.
    std::optional<std::string> secret_hex;

    [[nodiscard]] DecryptionMode mode() const noexcept {
        return secret_hex ? DecryptionMode::Local : DecryptionMode::Deferred;
    }
};

/// Body used when a claim package is not decrypted locally
inline constexpr std::string_view DEFERRED_BODY_PLACEHOLDER =
    "This message was left for you through Farewell and is sealed on-chain.\n"
    "To read it, open the claim package with the Farewell decrypter and enter\n"
    "the secret the sender shared with you.";

/// Subject used when the input carries none
inline constexpr std::string_view DEFAULT_SUBJECT = "A Farewell message for you";

/// Parses and normalizes claim packages and direct messages
class ClaimParser {
public:
    ClaimParser() = default;
    ~ClaimParser() = default;

    // Stateless
    ClaimParser(const ClaimParser&) = delete;
    ClaimParser& operator=(const ClaimParser&) = delete;
    ClaimParser(ClaimParser&&) = delete;
    ClaimParser& operator=(ClaimParser&&) = delete;

    // ========================================================================
    // Parsing
    // ========================================================================

    /// Parse JSON text into one of the two input shapes
    /// @return The input, or MissingField / MalformedInput naming the problem
    [[nodiscard]] static Result<ClaimInput> parse(std::string_view text);

    /// Parse an already-loaded JSON document
    [[nodiscard]] static Result<ClaimInput> parse_document(json_object* document);

    // ========================================================================
    // Normalization
    // ========================================================================

    /// Build the MessageData for either input shape
    /// @param input A parsed claim package or direct message
    /// @param options Decryption policy (secret present or not)
    /// @return The message, or the key/payload error that prevented decryption
    [[nodiscard]] static Result<MessageData> normalize(
        const ClaimInput& input,
        const ClaimOptions& options = {}
    );

    /// parse() followed by normalize()
    [[nodiscard]] static Result<MessageData> load(
        std::string_view text,
        const ClaimOptions& options = {}
    );

    /// Read a JSON file, then load() it
    [[nodiscard]] static Result<MessageData> load_file(
        const std::filesystem::path& path,
        const ClaimOptions& options = {}
    );

    // ========================================================================
    // Validation
    // ========================================================================

    /// Minimal address shape: non-empty, contains '@', no surrounding whitespace
    [[nodiscard]] static bool is_valid_address(std::string_view address) noexcept;
};

} // namespace farewell

#endif // FAREWELL_CLAIM_PARSER_HPP
