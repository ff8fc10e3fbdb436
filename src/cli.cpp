// ============================================================================
// Farewell - Command Line Interface Implementation
// ============================================================================

#include "farewell/cli.hpp"
#include "farewell/farewell.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <iostream>

namespace farewell::cli {

// ============================================================================
// Logging
// ============================================================================

void print_error(std::string_view message) {
    std::cerr << "[ERROR] " << message << "\n";
}

void print_success(std::string_view message) {
    std::cerr << "[OK] " << message << "\n";
}

void print_info(std::string_view message) {
    std::cerr << "[INFO] " << message << "\n";
}

void print_debug(const ParsedArgs& args, std::string_view message) {
    if (args.verbose) {
        std::cerr << "[DEBUG] " << message << "\n";
    }
}

// ============================================================================
// Utilities
// ============================================================================

ExitCode exit_code_for(const Error& error) noexcept {
    switch (error.code) {
        case ErrorCode::Success:
            return ExitCode::Success;

        case ErrorCode::MissingField:
        case ErrorCode::MalformedInput:
        case ErrorCode::RecipientCountMismatch:
            return ExitCode::InputError;

        case ErrorCode::KeyLengthMismatch:
        case ErrorCode::RandomGenerationFailed:
        case ErrorCode::MalformedPayload:
        case ErrorCode::DecryptionAuthFailure:
        case ErrorCode::EncodingError:
        case ErrorCode::CipherInitFailed:
        case ErrorCode::CipherUpdateFailed:
        case ErrorCode::CipherFinalizeFailed:
        case ErrorCode::HashFailed:
            return ExitCode::CryptoError;

        case ErrorCode::ValidationFailure:
            return ExitCode::ValidationError;

        case ErrorCode::FileNotFound:
        case ErrorCode::FileReadError:
        case ErrorCode::FileWriteError:
        case ErrorCode::FileTooLarge:
            return ExitCode::FileError;

        case ErrorCode::InvalidArgument:
            return ExitCode::InvalidArguments;

        case ErrorCode::InternalError:
            return ExitCode::InternalError;
    }
    return ExitCode::InternalError;
}

Result<ClaimOptions> claim_options(const ParsedArgs& args) {
    ClaimOptions options;

    if (args.secret && args.secret_file) {
        return fail(ErrorCode::InvalidArgument, "use either --secret or --secret-file, not both");
    }

    if (args.secret) {
        options.secret_hex = *args.secret;
    } else if (args.secret_file) {
        auto content = read_text_file(*args.secret_file);
        if (!content) {
            return std::unexpected(content.error());
        }
        // Secret files usually end with a newline
        while (!content->empty() && std::isspace(static_cast<unsigned char>(content->back()))) {
            content->pop_back();
        }
        options.secret_hex = std::move(*content);
    }

    return options;
}

namespace {

/// Report a core error and convert it to an exit code
ExitCode report(std::string_view context, const Error& error) {
    print_error(std::format("{}: {}", context, error.message()));
    return exit_code_for(error);
}

/// Write a document to --output, or to stdout
ExitCode emit(const ParsedArgs& args, std::string_view document, std::string_view what) {
    if (args.output) {
        if (auto written = write_text_file(*args.output, document); !written) {
            return report("Cannot write output", written.error());
        }
        print_success(std::format("Wrote {} -> {}", what, *args.output));
    } else {
        std::cout << document;
        if (!document.ends_with('\n')) {
            std::cout << "\n";
        }
    }
    return ExitCode::Success;
}

std::optional<std::uint64_t> parse_index(std::string_view text) {
    std::uint64_t value = 0;
    auto [end, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
    if (text.empty() || ec != std::errc{} || end != text.data() + text.size()) {
        return std::nullopt;
    }
    return value;
}

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

ParsedArgs parse_args(std::span<char*> args) {
    ParsedArgs result;

    for (std::size_t i = 1; i < args.size(); ++i) {
        std::string_view arg = args[i];

        if (arg.starts_with("--")) {
            std::string_view option = arg.substr(2);

            if (option == "help") {
                result.help = true;
            } else if (option == "verbose") {
                result.verbose = true;
            } else if (option.starts_with("output=")) {
                result.output = std::string(option.substr(7));
            } else if (option.starts_with("secret=")) {
                result.secret = std::string(option.substr(7));
            } else if (option.starts_with("secret-file=")) {
                result.secret_file = std::string(option.substr(12));
            } else if (option.starts_with("owner=")) {
                result.owner = std::string(option.substr(6));
            } else if (option.starts_with("index=")) {
                result.message_index = parse_index(option.substr(6));
                if (!result.message_index) {
                    result.invalid.push_back(std::format(
                        "--index expects a non-negative integer, got '{}'", option.substr(6)));
                }
            } else if (option.starts_with("sent=")) {
                result.sent_files.emplace_back(option.substr(5));
            } else {
                result.invalid.push_back(std::format("Unknown option '{}'", arg));
            }
        } else if (arg.starts_with("-") && arg.size() > 1) {
            // Short options
            for (std::size_t j = 1; j < arg.size(); ++j) {
                switch (arg[j]) {
                    case 'h': result.help = true; break;
                    case 'v': result.verbose = true; break;
                    case 'o':
                        if (i + 1 < args.size()) {
                            result.output = args[++i];
                        } else {
                            result.invalid.emplace_back("-o expects a file name");
                        }
                        break;
                    case 's':
                        if (i + 1 < args.size()) {
                            result.sent_files.emplace_back(args[++i]);
                        } else {
                            result.invalid.emplace_back("-s expects a file name");
                        }
                        break;
                    default:
                        result.invalid.push_back(std::format("Unknown option '-{}'", arg[j]));
                        break;
                }
            }
        } else {
            // Positional argument
            if (result.command.empty()) {
                result.command = std::string(arg);
            } else {
                result.positional.push_back(std::string(arg));
            }
        }
    }

    return result;
}

// ============================================================================
// Help Command
// ============================================================================

ExitCode cmd_help(const ParsedArgs& args) {
    // "farewell help prove" and "farewell prove --help" show the same page
    std::string_view topic = args.command;
    if (topic == "help") {
        topic = args.positional.empty() ? std::string_view{} : std::string_view{args.positional[0]};
    }

    if (topic == "claim") {
        std::cout << R"(
farewell claim - Read a claim package or direct message

USAGE:
    farewell claim <package.json> [options]

OPTIONS:
    --secret=<hex>        Off-chain secret; decrypts the payload locally
    --secret-file=<file>  Read the secret from a file
    --output=<file>, -o   Write the message body to a file (default: stdout)

Without a secret the body is a notice pointing the recipient to the
Farewell decrypter, and the payload is left sealed.
)";
    } else if (topic == "prove") {
        std::cout << R"(
farewell prove - Build a delivery proof

USAGE:
    farewell prove <package.json> --sent=<file> [--sent=<file> ...] [options]

OPTIONS:
    --sent=<file>, -s     Raw sent message (.eml), one per recipient, in order
    --owner=<address>     Message owner (default: "owner" of the package)
    --index=<n>           Message index (default: "messageIndex" of the package)
    --secret=<hex>        Off-chain secret, as for 'claim'
    --output=<file>, -o   Write the proof to a file (default: stdout)
)";
    } else if (topic == "validate") {
        std::cout << R"(
farewell validate - Check a delivery proof before submission

USAGE:
    farewell validate <delivery-proof.json>

Exits with 0 when the proof is well-formed, 5 otherwise.
)";
    } else if (topic == "commit") {
        std::cout << R"(
farewell commit - Print a recipient commitment

USAGE:
    farewell commit <address>
)";
    } else {
        std::cout << R"(
Farewell - claim and delivery-proof tool

USAGE:
    farewell <command> [options] [arguments]

COMMANDS:
    claim       Read a claim package (decrypting it when a secret is given)
    prove       Build a delivery proof from the messages that were sent
    validate    Check that a delivery proof is well-formed
    commit      Print the recipient commitment of an address
    version     Show version information
    help        Show this help message

GLOBAL OPTIONS:
    --verbose, -v   Print debug output

EXAMPLES:
    farewell claim package.json --secret=0x00112233445566778899aabbccddeeff
    farewell prove package.json --sent=alice.eml --sent=bob.eml -o proof.json
    farewell validate proof.json
    farewell commit Alice@Example.com

Use 'farewell help <command>' for more information about a command.
)";
    }

    return ExitCode::Success;
}

// ============================================================================
// Version Command
// ============================================================================

ExitCode cmd_version() {
    std::cout << std::format("Farewell v{}\n", VERSION_STRING);
    std::cout << "Payload cipher: AES-128-GCM (key = skShare XOR secret)\n";
    std::cout << std::format("Recipient commitment: {} of the normalized address\n",
                             constants::COMMITMENT_DIGEST);
    return ExitCode::Success;
}

// ============================================================================
// Claim Command
// ============================================================================

ExitCode cmd_claim(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing claim package. Use: farewell claim <package.json>");
        return ExitCode::InvalidArguments;
    }

    auto options = claim_options(args);
    if (!options) {
        return report("Cannot read secret", options.error());
    }

    print_info(std::format("Decryption mode: {}", decryption_mode_to_string(options->mode())));

    const std::string& package_path = args.positional[0];
    auto message = ClaimParser::load_file(package_path, *options);
    if (!message) {
        return report(std::format("Cannot claim {}", package_path), message.error());
    }

    print_info(std::format("Subject: {}", message->subject));
    print_info(std::format("Content hash: {}", message->content_hash));
    for (std::size_t i = 0; i < message->recipients.size(); ++i) {
        print_info(std::format("Recipient {}: {}", i, message->recipients[i]));
    }
    print_debug(args, std::format("Body source: {}, {} bytes",
                                  body_source_to_string(message->source), message->body.size()));

    return emit(args, message->body, "message body");
}

// ============================================================================
// Prove Command
// ============================================================================

ExitCode cmd_prove(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing claim package. Use: farewell prove <package.json> --sent=<file>");
        return ExitCode::InvalidArguments;
    }

    auto options = claim_options(args);
    if (!options) {
        return report("Cannot read secret", options.error());
    }

    const std::string& package_path = args.positional[0];
    auto message = ClaimParser::load_file(package_path, *options);
    if (!message) {
        return report(std::format("Cannot read {}", package_path), message.error());
    }

    std::optional<std::string> owner = args.owner ? args.owner : message->owner;
    if (!owner) {
        print_error("Missing owner. Use --owner=<address> or add \"owner\" to the package");
        return ExitCode::InvalidArguments;
    }

    std::optional<std::uint64_t> message_index =
        args.message_index ? args.message_index : message->message_index;
    if (!message_index) {
        print_error("Missing message index. Use --index=<n> or add \"messageIndex\" to the package");
        return ExitCode::InvalidArguments;
    }

    if (args.sent_files.size() != message->recipients.size()) {
        print_error(std::format("{} recipients but {} --sent files; give one sent message per recipient",
                                message->recipients.size(), args.sent_files.size()));
        return ExitCode::InvalidArguments;
    }

    std::vector<std::string> sent_messages;
    sent_messages.reserve(args.sent_files.size());
    for (const std::string& path : args.sent_files) {
        auto content = read_text_file(path);
        if (!content) {
            return report("Cannot read sent message", content.error());
        }
        print_debug(args, std::format("Read {} ({} bytes)", path, content->size()));
        sent_messages.push_back(std::move(*content));
    }

    auto proof = ProofAssembler::prove(*message, sent_messages, *owner, *message_index);
    if (!proof) {
        return report("Cannot assemble delivery proof", proof.error());
    }

    // The assembler guarantees the shapes; check the serialized form anyway
    auto verdict = ProofValidator::validate(*proof);
    if (!verdict) {
        return report("Assembled proof is not submittable",
                      Error{ErrorCode::ValidationFailure, verdict.error});
    }

    print_info(std::format("Delivery proof for message {} of {} ({} recipients)",
                           proof->message_index, proof->owner, proof->recipient_proofs.size()));

    return emit(args, ProofAssembler::to_json(*proof), "delivery proof");
}

// ============================================================================
// Validate Command
// ============================================================================

ExitCode cmd_validate(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing proof file. Use: farewell validate <delivery-proof.json>");
        return ExitCode::InvalidArguments;
    }

    const std::string& proof_path = args.positional[0];
    auto content = read_text_file(proof_path);
    if (!content) {
        return report("Cannot read proof", content.error());
    }

    auto verdict = ProofValidator::validate_json(*content);
    if (!verdict) {
        print_error(std::format("{} is not a valid delivery proof: {}", proof_path, verdict.error));
        return ExitCode::ValidationError;
    }

    print_success(std::format("{} is a valid delivery proof", proof_path));
    return ExitCode::Success;
}

// ============================================================================
// Commit Command
// ============================================================================

ExitCode cmd_commit(const ParsedArgs& args) {
    if (args.positional.empty()) {
        print_error("Missing address. Use: farewell commit <address>");
        return ExitCode::InvalidArguments;
    }

    const std::string& address = args.positional[0];
    if (!ClaimParser::is_valid_address(RecipientCommitment::normalize(address))) {
        print_error(std::format("'{}' is not a valid email address", address));
        return ExitCode::InvalidArguments;
    }

    auto commitment = RecipientCommitment::compute(address);
    if (!commitment) {
        return report("Cannot compute commitment", commitment.error());
    }

    print_debug(args, std::format("Normalized address: {}", RecipientCommitment::normalize(address)));
    std::cout << *commitment << "\n";
    return ExitCode::Success;
}

// ============================================================================
// Main Entry Point
// ============================================================================

ExitCode run(std::span<char*> args) {
    if (args.size() < 2) {
        (void)cmd_help({});
        return ExitCode::InvalidArguments;
    }

    ParsedArgs parsed = parse_args(args);

    if (parsed.help) {
        return cmd_help(parsed);
    }

    if (!parsed.invalid.empty()) {
        for (const auto& problem : parsed.invalid) {
            print_error(problem);
        }
        return ExitCode::InvalidArguments;
    }

    if (parsed.command == "help") {
        return cmd_help(parsed);
    } else if (parsed.command == "version" || parsed.command == "--version") {
        return cmd_version();
    } else if (parsed.command == "claim") {
        return cmd_claim(parsed);
    } else if (parsed.command == "prove") {
        return cmd_prove(parsed);
    } else if (parsed.command == "validate") {
        return cmd_validate(parsed);
    } else if (parsed.command == "commit") {
        return cmd_commit(parsed);
    } else {
        print_error(std::format("Unknown command: '{}'. Use 'farewell help' for usage.",
                                parsed.command));
        return ExitCode::InvalidArguments;
    }
}

} // namespace farewell::cli
