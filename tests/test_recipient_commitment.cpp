// ============================================================================
// Farewell - Recipient Commitment Tests
// ============================================================================

#include <gtest/gtest.h>
#include "farewell/encoding.hpp"
#include "farewell/recipient_commitment.hpp"

namespace farewell::tests {

TEST(RecipientCommitmentTest, Normalize_TrimsAndLowerCases) {
    EXPECT_EQ(RecipientCommitment::normalize("  Alice@Example.COM\t\n"), "alice@example.com");
    EXPECT_EQ(RecipientCommitment::normalize("bob@example.org"), "bob@example.org");
    EXPECT_EQ(RecipientCommitment::normalize(""), "");
}

TEST(RecipientCommitmentTest, Normalize_LeavesNonAsciiBytesAlone) {
    EXPECT_EQ(RecipientCommitment::normalize("J\xC3\x9CRGEN@X.DE"), "j\xC3\x9Crgen@x.de");
}

TEST(RecipientCommitmentTest, HashBytes_MatchesSha256) {
    auto empty = RecipientCommitment::hash_bytes(ByteSpan{});
    ASSERT_TRUE(empty.has_value());
    EXPECT_EQ(encoding::hex_encode(*empty, false),
              "e3b0c44298fc1c149afbf4c8996fb92427ae41e4649b934ca495991b7852b855");

    auto abc = RecipientCommitment::hash_bytes(encoding::as_bytes("abc"));
    ASSERT_TRUE(abc.has_value());
    EXPECT_EQ(encoding::hex_encode(*abc, false),
              "ba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(RecipientCommitmentTest, Compute_HashesNormalizedForm) {
    auto commitment = RecipientCommitment::compute("  ABC ");
    ASSERT_TRUE(commitment.has_value());
    EXPECT_EQ(*commitment, "0xba7816bf8f01cfea414140de5dae2223b00361a396177a9cb410ff61f20015ad");
}

TEST(RecipientCommitmentTest, Compute_IsCaseAndWhitespaceInsensitive) {
    auto lower = RecipientCommitment::compute("alice@example.com");
    auto mixed = RecipientCommitment::compute("  Alice@EXAMPLE.com ");
    ASSERT_TRUE(lower.has_value());
    ASSERT_TRUE(mixed.has_value());
    EXPECT_EQ(*lower, *mixed);
}

TEST(RecipientCommitmentTest, Compute_DistinctAddressesDiffer) {
    auto alice = RecipientCommitment::compute("alice@example.com");
    auto bob = RecipientCommitment::compute("bob@example.com");
    ASSERT_TRUE(alice.has_value());
    ASSERT_TRUE(bob.has_value());
    EXPECT_NE(*alice, *bob);
}

TEST(RecipientCommitmentTest, Compute_Format) {
    auto commitment = RecipientCommitment::compute("alice@example.com");
    ASSERT_TRUE(commitment.has_value());

    ASSERT_EQ(commitment->size(), 2 + 2 * constants::COMMITMENT_SIZE);
    EXPECT_TRUE(commitment->starts_with("0x"));
    for (char c : commitment->substr(2)) {
        EXPECT_TRUE((c >= '0' && c <= '9') || (c >= 'a' && c <= 'f')) << c;
    }
}

TEST(RecipientCommitmentTest, Digest_MatchesCompute) {
    auto raw = RecipientCommitment::digest("Alice@Example.com");
    auto hex = RecipientCommitment::compute("alice@example.com");
    ASSERT_TRUE(raw.has_value());
    ASSERT_TRUE(hex.has_value());
    EXPECT_EQ(raw->size(), constants::COMMITMENT_SIZE);
    EXPECT_EQ(encoding::hex_encode(*raw), *hex);
}

} // namespace farewell::tests
