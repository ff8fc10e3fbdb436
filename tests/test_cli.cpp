// ============================================================================
// Farewell - CLI Tests
// ============================================================================
// Argument parsing plus end-to-end runs of the commands against temporary
// files. Documents are written with --output so nothing depends on stdout.
// ============================================================================

#include <gtest/gtest.h>
#include "farewell/cli.hpp"
#include "farewell/encoding.hpp"
#include "farewell/json.hpp"
#include "farewell/payload_encryptor.hpp"
#include "farewell/proof_validator.hpp"

#include <filesystem>
#include <format>
#include <fstream>
#include <initializer_list>
#include <iterator>
#include <span>

namespace farewell::tests {

using cli::ExitCode;

namespace {

/// Owns argv storage for a simulated command line
class CommandLine {
public:
    CommandLine(std::initializer_list<std::string> args) : storage_(args) {
        storage_.insert(storage_.begin(), "farewell");
        for (auto& arg : storage_) {
            pointers_.push_back(arg.data());
        }
    }

    [[nodiscard]] std::span<char*> span() { return pointers_; }

private:
    std::vector<std::string> storage_;
    std::vector<char*> pointers_;
};

/// Temporary directory removed at the end of each test
class CliTest : public ::testing::Test {
protected:
    void SetUp() override {
        dir_ = std::filesystem::temp_directory_path() /
               std::format("farewell_cli_test_{}",
                           ::testing::UnitTest::GetInstance()->current_test_info()->name());
        std::filesystem::create_directories(dir_);
    }

    void TearDown() override {
        std::error_code ec;
        std::filesystem::remove_all(dir_, ec);
    }

    std::string write(const std::string& name, const std::string& content) {
        auto path = dir_ / name;
        std::ofstream out(path, std::ios::binary);
        out << content;
        return path.string();
    }

    std::string read(const std::string& name) {
        std::ifstream in(dir_ / name, std::ios::binary);
        return {std::istreambuf_iterator<char>(in), std::istreambuf_iterator<char>()};
    }

    std::string path(const std::string& name) const { return (dir_ / name).string(); }

    std::filesystem::path dir_;
};

const std::string kSecret = "0x0f0e0d0c0b0a09080706050403020100";

/// A claim package whose payload decrypts with kSecret
std::string claim_package(std::string_view message) {
    ByteBuffer share{0x00, 0x11, 0x22, 0x33, 0x44, 0x55, 0x66, 0x77,
                     0x88, 0x99, 0xaa, 0xbb, 0xcc, 0xdd, 0xee, 0xff};
    auto secret = encoding::hex_decode(kSecret);
    EXPECT_TRUE(secret.has_value());

    ByteBuffer key(constants::AES_KEY_SIZE);
    for (std::size_t i = 0; i < key.size(); ++i) {
        key[i] = static_cast<Byte>(share[i] ^ (*secret)[i]);
    }

    auto payload = PayloadEncryptor::encrypt_text(message, key);
    EXPECT_TRUE(payload.has_value());

    return R"({
        "type": "farewell-claim-package",
        "recipients": ["alice@example.com", "bob@example.org"],
        "skShare": ")" + encoding::hex_encode(share) + R"(",
        "encryptedPayload": ")" + encoding::hex_encode(*payload) + R"(",
        "contentHash": "0x5eed",
        "owner": "0x2222222222222222222222222222222222222222",
        "messageIndex": 4
    })";
}

} // anonymous namespace

// ============================================================================
// Argument Parsing
// ============================================================================

TEST(CliParseTest, ParsesCommandOptionsAndPositionals) {
    CommandLine line{"prove", "package.json", "--sent=a.eml", "-s", "b.eml",
                     "--owner=0xabc", "--index=9", "-o", "proof.json", "-v"};
    auto args = cli::parse_args(line.span());

    EXPECT_EQ(args.command, "prove");
    EXPECT_EQ(args.positional, std::vector<std::string>{"package.json"});
    EXPECT_EQ(args.sent_files, (std::vector<std::string>{"a.eml", "b.eml"}));
    EXPECT_EQ(args.owner, "0xabc");
    EXPECT_EQ(args.message_index, 9u);
    EXPECT_EQ(args.output, "proof.json");
    EXPECT_TRUE(args.verbose);
    EXPECT_TRUE(args.invalid.empty());
}

TEST(CliParseTest, CollectsInvalidOptions) {
    CommandLine line{"claim", "--index=-1", "--frobnicate", "-o"};
    auto args = cli::parse_args(line.span());

    EXPECT_FALSE(args.message_index.has_value());
    EXPECT_EQ(args.invalid.size(), 3u);
}

TEST(CliParseTest, SecretOptions) {
    CommandLine line{"claim", "p.json", "--secret=0x01", "--secret-file=s.txt"};
    auto args = cli::parse_args(line.span());
    EXPECT_EQ(args.secret, "0x01");
    EXPECT_EQ(args.secret_file, "s.txt");

    auto options = cli::claim_options(args);
    ASSERT_FALSE(options.has_value());
    EXPECT_EQ(options.error().code, ErrorCode::InvalidArgument);
}

TEST(CliParseTest, ExitCodeForErrors) {
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::FileNotFound}), ExitCode::FileError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::DecryptionAuthFailure}), ExitCode::CryptoError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::KeyLengthMismatch}), ExitCode::CryptoError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::MissingField}), ExitCode::InputError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::RecipientCountMismatch}), ExitCode::InputError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::ValidationFailure}), ExitCode::ValidationError);
    EXPECT_EQ(cli::exit_code_for(Error{ErrorCode::InvalidArgument}), ExitCode::InvalidArguments);
}

// ============================================================================
// Commands
// ============================================================================

TEST_F(CliTest, Claim_WithSecret_WritesDecryptedBody) {
    auto package = write("package.json", claim_package("Thank you for everything."));

    CommandLine line{"claim", package, "--secret=" + kSecret, "--output=" + path("body.txt")};
    EXPECT_EQ(cli::run(line.span()), ExitCode::Success);
    EXPECT_EQ(read("body.txt"), "Thank you for everything.");
}

TEST_F(CliTest, Claim_SecretFile_IsTrimmed) {
    auto package = write("package.json", claim_package("From a file."));
    auto secret = write("secret.txt", kSecret + "\n");

    CommandLine line{"claim", package, "--secret-file=" + secret, "-o", path("body.txt")};
    EXPECT_EQ(cli::run(line.span()), ExitCode::Success);
    EXPECT_EQ(read("body.txt"), "From a file.");
}

TEST_F(CliTest, Claim_WithoutSecret_WritesPlaceholder) {
    auto package = write("package.json", claim_package("sealed"));

    CommandLine line{"claim", package, "-o", path("body.txt")};
    EXPECT_EQ(cli::run(line.span()), ExitCode::Success);
    EXPECT_EQ(read("body.txt"), DEFERRED_BODY_PLACEHOLDER);
}

TEST_F(CliTest, Claim_WrongSecret_IsCryptoError) {
    auto package = write("package.json", claim_package("sealed"));

    CommandLine line{"claim", package, "--secret=0x00000000000000000000000000000000",
                     "-o", path("body.txt")};
    EXPECT_EQ(cli::run(line.span()), ExitCode::CryptoError);
    EXPECT_FALSE(std::filesystem::exists(path("body.txt")));
}

TEST_F(CliTest, Claim_MissingFile_IsFileError) {
    CommandLine line{"claim", path("nope.json")};
    EXPECT_EQ(cli::run(line.span()), ExitCode::FileError);
}

TEST_F(CliTest, Prove_ThenValidate) {
    auto package = write("package.json", claim_package("bye"));
    auto alice = write("alice.eml", "DKIM-Signature: v=1; d=example.net; s=mail; b=AA==\r\n"
                                    "To: alice@example.com\r\n\r\nbye\r\n");
    auto bob = write("bob.eml", "To: bob@example.org\r\n\r\nbye\r\n");

    CommandLine prove{"prove", package, "--sent=" + alice, "--sent=" + bob,
                      "-o", path("proof.json")};
    ASSERT_EQ(cli::run(prove.span()), ExitCode::Success);

    std::string proof = read("proof.json");
    EXPECT_TRUE(ProofValidator::validate_json(proof).valid);
    EXPECT_NE(proof.find("0x2222222222222222222222222222222222222222"), std::string::npos);

    CommandLine validate{"validate", path("proof.json")};
    EXPECT_EQ(cli::run(validate.span()), ExitCode::Success);
}

TEST_F(CliTest, Prove_OwnerAndIndexOverrides) {
    auto package = write("package.json", claim_package("bye"));
    auto alice = write("alice.eml", "To: alice@example.com\r\n\r\nbye\r\n");
    auto bob = write("bob.eml", "To: bob@example.org\r\n\r\nbye\r\n");

    CommandLine prove{"prove", package, "-s", alice, "-s", bob,
                      "--owner=0x3333333333333333333333333333333333333333", "--index=12",
                      "-o", path("proof.json")};
    ASSERT_EQ(cli::run(prove.span()), ExitCode::Success);

    auto proof = json::parse(read("proof.json"));
    ASSERT_TRUE(proof.has_value()) << proof.error().message();

    auto owner = json::find(proof->get(), "owner");
    ASSERT_TRUE(owner.has_value());
    EXPECT_EQ(json::string_value(*owner), "0x3333333333333333333333333333333333333333");

    auto index = json::find(proof->get(), "messageIndex");
    ASSERT_TRUE(index.has_value());
    EXPECT_EQ(json::type_name(*index), "integer");
    EXPECT_EQ(json::as_uint64(*index), std::optional<std::uint64_t>{12});
}

TEST_F(CliTest, Prove_OutputIntoNewDirectory) {
    auto package = write("package.json", claim_package("bye"));
    auto alice = write("alice.eml", "To: alice@example.com\r\n\r\nbye\r\n");
    auto bob = write("bob.eml", "To: bob@example.org\r\n\r\nbye\r\n");

    CommandLine prove{"prove", package, "-s", alice, "-s", bob,
                      "--output=" + path("new_dir/nested/proof.json")};
    ASSERT_EQ(cli::run(prove.span()), ExitCode::Success);
    EXPECT_TRUE(std::filesystem::exists(path("new_dir/nested/proof.json")));

    CommandLine validate{"validate", path("new_dir/nested/proof.json")};
    EXPECT_EQ(cli::run(validate.span()), ExitCode::Success);
}

TEST_F(CliTest, Prove_WrongSentCount_IsInvalidArguments) {
    auto package = write("package.json", claim_package("bye"));
    auto alice = write("alice.eml", "To: alice@example.com\r\n\r\nbye\r\n");

    CommandLine prove{"prove", package, "--sent=" + alice, "-o", path("proof.json")};
    EXPECT_EQ(cli::run(prove.span()), ExitCode::InvalidArguments);
}

TEST_F(CliTest, Validate_BadProof_IsValidationError) {
    auto proof = write("proof.json", R"({"owner": "0x11", "messageIndex": 0})");

    CommandLine line{"validate", proof};
    EXPECT_EQ(cli::run(line.span()), ExitCode::ValidationError);
}

TEST_F(CliTest, Commit_RejectsNonAddress) {
    CommandLine line{"commit", "not-an-address"};
    EXPECT_EQ(cli::run(line.span()), ExitCode::InvalidArguments);
}

TEST_F(CliTest, UnknownCommand_IsInvalidArguments) {
    CommandLine line{"frobnicate"};
    EXPECT_EQ(cli::run(line.span()), ExitCode::InvalidArguments);
}

} // namespace farewell::tests
