// ============================================================================
// Farewell - Command Line Interface
// ============================================================================
// A command-line front end to the claimer core.
//
// Usage:
//   farewell <command> [options]
//
// Commands:
//   claim       Read a claim package (decrypting it when a secret is given)
//   prove       Build a delivery proof from the messages that were sent
//   validate    Check that a delivery proof is well-formed
//   commit      Print the recipient commitment of an address
//   help        Show help information
//   version     Show version information
//
// Documents (message bodies, proofs, commitments) go to stdout or --output;
// status lines ([INFO], [OK], [ERROR], [DEBUG]) go to stderr.
// ============================================================================

#ifndef FAREWELL_CLI_HPP
#define FAREWELL_CLI_HPP

#include "farewell/claim_parser.hpp"
#include "farewell/types.hpp"

#include <cstdint>
#include <optional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace farewell::cli {

/// Exit codes for the CLI
enum class ExitCode : int {
    Success = 0,
    InvalidArguments = 1,
    FileError = 2,
    CryptoError = 3,
    InputError = 4,
    ValidationError = 5,
    InternalError = 6
};

/// CLI argument parser result
struct ParsedArgs {
    std::string command;
    std::vector<std::string> positional;

    // Flags
    bool help = false;
    bool verbose = false;

    // Options with values
    std::optional<std::string> output;
    std::optional<std::string> secret;       // Off-chain secret, hex
    std::optional<std::string> secret_file;  // File holding the secret
    std::optional<std::string> owner;
    std::optional<std::uint64_t> message_index;
    std::vector<std::string> sent_files;     // One raw sent message per recipient

    /// Options that could not be parsed, reported before dispatch
    std::vector<std::string> invalid;
};

/// Parse command line arguments
[[nodiscard]] ParsedArgs parse_args(std::span<char*> args);

/// Main CLI entry point
[[nodiscard]] ExitCode run(std::span<char*> args);

// Command handlers
[[nodiscard]] ExitCode cmd_help(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_version();
[[nodiscard]] ExitCode cmd_claim(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_prove(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_validate(const ParsedArgs& args);
[[nodiscard]] ExitCode cmd_commit(const ParsedArgs& args);

// Logging
void print_error(std::string_view message);
void print_success(std::string_view message);
void print_info(std::string_view message);
void print_debug(const ParsedArgs& args, std::string_view message);

// Utility functions

/// Map a core error to the process exit code
[[nodiscard]] ExitCode exit_code_for(const Error& error) noexcept;

/// Decryption policy from --secret / --secret-file
[[nodiscard]] Result<ClaimOptions> claim_options(const ParsedArgs& args);

} // namespace farewell::cli

#endif // FAREWELL_CLI_HPP
