// ============================================================================
// Farewell - Proof Assembler Tests
// ============================================================================

#include <gtest/gtest.h>
#include "farewell/encoding.hpp"
#include "farewell/proof_assembler.hpp"
#include "farewell/recipient_commitment.hpp"

#include <json-c/json.h>

namespace farewell::tests {

namespace {

const std::string kOwner = "0x1111111111111111111111111111111111111111";

const std::string kSignedMessage =
    "DKIM-Signature: v=1; a=rsa-sha256; c=relaxed/relaxed; d=Mail.Example.com;\r\n"
    " s=sel2024; h=from:to:subject; bh=47DEQpj8HBSa+/TImW+5JCeuQeRkm5NMpJWZG3hSuFU=;\r\n"
    " b=dGVzdA==\r\n"
    "From: owner@mail.example.com\r\n"
    "To: alice@example.com\r\n"
    "Subject: Goodbye\r\n"
    "\r\n"
    "See you on the other side.\r\n";

const std::string kUnsignedMessage =
    "From: owner@example.com\n"
    "To: bob@example.org\n"
    "Subject: Goodbye\n"
    "\n"
    "DKIM-Signature: d=body.example; s=ignored\n";

MessageData two_recipient_message() {
    MessageData message;
    message.recipients = {"Alice@Example.com", "bob@example.org"};
    message.content_hash = "0xabc123";
    message.body = "See you on the other side.";
    message.subject = "Goodbye";
    message.source = BodySource::Direct;
    return message;
}

} // anonymous namespace

// ============================================================================
// Signals
// ============================================================================

TEST(ProofAssemblerTest, DkimKeySignal_HashesSelectorAndDomain) {
    auto signal = ProofAssembler::dkim_key_signal(kSignedMessage);
    ASSERT_TRUE(signal.has_value()) << signal.error().message();

    auto expected = RecipientCommitment::hash_bytes(
        encoding::as_bytes("sel2024._domainkey.mail.example.com"));
    ASSERT_TRUE(expected.has_value());
    EXPECT_EQ(*signal, encoding::hex_encode(*expected));
}

TEST(ProofAssemblerTest, DkimKeySignal_UnsignedMessageIsZero) {
    // A DKIM-Signature line in the body is not a header
    auto signal = ProofAssembler::dkim_key_signal(kUnsignedMessage);
    ASSERT_TRUE(signal.has_value());
    EXPECT_EQ(*signal, "0x" + std::string(2 * constants::COMMITMENT_SIZE, '0'));
}

// ============================================================================
// Recipient Proofs
// ============================================================================

TEST(ProofAssemblerTest, Assemble_FillsShapesAndSignals) {
    auto proof = ProofAssembler::assemble("0xabc123", "Alice@Example.com", kSignedMessage, 3);
    ASSERT_TRUE(proof.has_value()) << proof.error().message();

    auto commitment = RecipientCommitment::compute("alice@example.com");
    ASSERT_TRUE(commitment.has_value());

    EXPECT_EQ(proof->recipient_index, 3u);
    EXPECT_EQ(proof->email, "alice@example.com");
    EXPECT_EQ(proof->recipient_hash, *commitment);

    EXPECT_EQ(proof->p_a.size(), 2u);
    EXPECT_EQ(proof->p_b.size(), 2u);
    EXPECT_EQ(proof->p_b[0].size(), 2u);
    EXPECT_EQ(proof->p_b[1].size(), 2u);
    EXPECT_EQ(proof->p_c.size(), 2u);

    ASSERT_EQ(proof->public_signals.size(), constants::PUBLIC_SIGNAL_COUNT);
    EXPECT_EQ(proof->public_signals[0], *commitment);
    EXPECT_EQ(proof->public_signals[2], "0xabc123");
}

TEST(ProofAssemblerTest, Assemble_PrefixesBareContentHash) {
    auto proof = ProofAssembler::assemble("abc123", "alice@example.com", kUnsignedMessage);
    ASSERT_TRUE(proof.has_value());
    EXPECT_EQ(proof->public_signals[2], "0xabc123");
}

TEST(ProofAssemblerTest, Assemble_RejectsBadArguments) {
    auto bad_hash = ProofAssembler::assemble("zz", "alice@example.com", kSignedMessage);
    ASSERT_FALSE(bad_hash.has_value());
    EXPECT_EQ(bad_hash.error().code, ErrorCode::MalformedInput);

    auto bad_address = ProofAssembler::assemble("0x01", "alice", kSignedMessage);
    ASSERT_FALSE(bad_address.has_value());
    EXPECT_EQ(bad_address.error().code, ErrorCode::MalformedInput);

    auto empty_message = ProofAssembler::assemble("0x01", "alice@example.com", "  \r\n");
    ASSERT_FALSE(empty_message.has_value());
    EXPECT_EQ(empty_message.error().code, ErrorCode::MalformedInput);
}

TEST(ProofAssemblerTest, AssembleAll_KeepsRecipientOrder) {
    MessageData message = two_recipient_message();
    std::vector<std::string> sent{kSignedMessage, kUnsignedMessage};

    auto proofs = ProofAssembler::assemble_all(message, sent);
    ASSERT_TRUE(proofs.has_value()) << proofs.error().message();
    ASSERT_EQ(proofs->size(), 2u);
    EXPECT_EQ((*proofs)[0].recipient_index, 0u);
    EXPECT_EQ((*proofs)[0].email, "alice@example.com");
    EXPECT_EQ((*proofs)[1].recipient_index, 1u);
    EXPECT_EQ((*proofs)[1].email, "bob@example.org");
}

TEST(ProofAssemblerTest, AssembleAll_CountMismatch) {
    MessageData message = two_recipient_message();
    std::vector<std::string> sent{kSignedMessage};

    auto proofs = ProofAssembler::assemble_all(message, sent);
    ASSERT_FALSE(proofs.has_value());
    EXPECT_EQ(proofs.error().code, ErrorCode::RecipientCountMismatch);
}

// ============================================================================
// Envelope
// ============================================================================

TEST(ProofAssemblerTest, BuildEnvelope_CountMismatch) {
    auto proof = ProofAssembler::assemble("0x01", "alice@example.com", kSignedMessage);
    ASSERT_TRUE(proof.has_value());

    auto envelope = ProofAssembler::build_envelope(kOwner, 0, {*proof}, 2);
    ASSERT_FALSE(envelope.has_value());
    EXPECT_EQ(envelope.error().code, ErrorCode::RecipientCountMismatch);
}

TEST(ProofAssemblerTest, BuildEnvelope_RequiresOwner) {
    auto proof = ProofAssembler::assemble("0x01", "alice@example.com", kSignedMessage);
    ASSERT_TRUE(proof.has_value());

    auto envelope = ProofAssembler::build_envelope("", 0, {*proof}, 1);
    ASSERT_FALSE(envelope.has_value());
    EXPECT_EQ(envelope.error().code, ErrorCode::MissingField);
}

TEST(ProofAssemblerTest, BuildEnvelope_RejectsOutOfOrderAndDuplicates) {
    auto first = ProofAssembler::assemble("0x01", "alice@example.com", kSignedMessage, 0);
    auto second = ProofAssembler::assemble("0x01", "ALICE@example.com", kSignedMessage, 1);
    auto misplaced = ProofAssembler::assemble("0x01", "bob@example.org", kSignedMessage, 5);
    ASSERT_TRUE(first.has_value());
    ASSERT_TRUE(second.has_value());
    ASSERT_TRUE(misplaced.has_value());

    auto duplicate = ProofAssembler::build_envelope(kOwner, 0, {*first, *second}, 2);
    ASSERT_FALSE(duplicate.has_value());
    EXPECT_EQ(duplicate.error().code, ErrorCode::MalformedInput);

    auto out_of_order = ProofAssembler::build_envelope(kOwner, 0, {*first, *misplaced}, 2);
    ASSERT_FALSE(out_of_order.has_value());
    EXPECT_EQ(out_of_order.error().code, ErrorCode::MalformedInput);
}

TEST(ProofAssemblerTest, Prove_BuildsEnvelope) {
    MessageData message = two_recipient_message();
    std::vector<std::string> sent{kSignedMessage, kUnsignedMessage};

    auto proof = ProofAssembler::prove(message, sent, kOwner, 42);
    ASSERT_TRUE(proof.has_value()) << proof.error().message();
    EXPECT_EQ(proof->owner, kOwner);
    EXPECT_EQ(proof->message_index, 42u);
    EXPECT_EQ(proof->recipient_proofs.size(), 2u);
}

// ============================================================================
// Rendering
// ============================================================================

TEST(ProofAssemblerTest, ToDocument_UsesWireFieldNamesAndTypes) {
    MessageData message = two_recipient_message();
    std::vector<std::string> sent{kSignedMessage, kUnsignedMessage};
    auto proof = ProofAssembler::prove(message, sent, kOwner, 42);
    ASSERT_TRUE(proof.has_value());

    json::Object document = ProofAssembler::to_document(*proof);
    json_object* root = document.get();

    auto type = json::find(root, "type");
    ASSERT_TRUE(type && json::is_string(*type));
    EXPECT_EQ(json::string_value(*type), constants::DELIVERY_PROOF_TYPE);

    auto version = json::find(root, "version");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(json::as_uint64(*version), std::optional<std::uint64_t>{1});

    auto owner = json::find(root, "owner");
    ASSERT_TRUE(owner && json::is_string(*owner));
    EXPECT_EQ(json::string_value(*owner), kOwner);

    auto message_index = json::find(root, "messageIndex");
    ASSERT_TRUE(message_index.has_value());
    EXPECT_EQ(json::type_name(*message_index), "integer");
    EXPECT_EQ(json::as_uint64(*message_index), std::optional<std::uint64_t>{42});

    auto proofs = json::find(root, "recipientProofs");
    ASSERT_TRUE(proofs && json::is_array(*proofs));
    ASSERT_EQ(json_object_array_length(*proofs), 2u);

    json_object* first = json_object_array_get_idx(*proofs, 0);
    EXPECT_EQ(json::string_value(*json::find(first, "email")), "alice@example.com");
    EXPECT_EQ(json::type_name(*json::find(first, "recipientIndex")), "integer");
    EXPECT_EQ(json_object_array_length(*json::find(first, "pA")), 2u);
    EXPECT_EQ(json_object_array_length(*json::find(first, "pB")), 2u);
    EXPECT_EQ(json_object_array_length(json_object_array_get_idx(*json::find(first, "pB"), 1)), 2u);
    EXPECT_EQ(json_object_array_length(*json::find(first, "pC")), 2u);
    EXPECT_EQ(json_object_array_length(*json::find(first, "publicSignals")), constants::PUBLIC_SIGNAL_COUNT);

    auto metadata = json::find(root, "metadata");
    ASSERT_TRUE(metadata && json::is_object(*metadata));
    EXPECT_EQ(json::as_uint64(*json::find(*metadata, "recipientCount")), std::optional<std::uint64_t>{2});
}

TEST(ProofAssemblerTest, ToJson_WritesIntegersAsNumbers) {
    MessageData message = two_recipient_message();
    std::vector<std::string> sent{kSignedMessage, kUnsignedMessage};
    auto proof = ProofAssembler::prove(message, sent, kOwner, 5);
    ASSERT_TRUE(proof.has_value());

    std::string text = ProofAssembler::to_json(*proof);
    EXPECT_NE(text.find("farewell-claimer/"), std::string::npos) << "slashes must not be escaped";

    auto reloaded = json::parse(text);
    ASSERT_TRUE(reloaded.has_value()) << reloaded.error().message();

    auto message_index = json::find(reloaded->get(), "messageIndex");
    ASSERT_TRUE(message_index.has_value());
    EXPECT_FALSE(json::is_string(*message_index));
    EXPECT_EQ(json::as_uint64(*message_index), std::optional<std::uint64_t>{5});

    auto version = json::find(reloaded->get(), "version");
    ASSERT_TRUE(version.has_value());
    EXPECT_EQ(json::as_uint64(*version), std::optional<std::uint64_t>{1});
}

} // namespace farewell::tests
