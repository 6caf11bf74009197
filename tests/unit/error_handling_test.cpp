/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * @brief Error types and their reporting
 */

#include <gtest/gtest.h>

#include <stdexcept>
#include <string>

#include "Errors.hpp"
#include "ReferenceValidator.hpp"

using namespace qr_bill;

// ============================================================================
// Error kinds
// ============================================================================

class ErrorKindTest : public ::testing::Test {};

TEST_F(ErrorKindTest, ValidationKindNames) {
    EXPECT_EQ(toString(ValidationErrorKind::MissingCompanyInfo), "MissingCompanyInfo");
    EXPECT_EQ(toString(ValidationErrorKind::MissingClientInfo), "MissingClientInfo");
    EXPECT_EQ(toString(ValidationErrorKind::MissingIBAN), "MissingIBAN");
    EXPECT_EQ(toString(ValidationErrorKind::InvalidIBAN), "InvalidIBAN");
    EXPECT_EQ(toString(ValidationErrorKind::UnsupportedCurrency), "UnsupportedCurrency");
    EXPECT_EQ(toString(ValidationErrorKind::NonPositiveAmount), "NonPositiveAmount");
}

TEST_F(ErrorKindTest, ReferenceKindNames) {
    EXPECT_EQ(toString(ReferenceErrorKind::MissingReference), "MissingReference");
    EXPECT_EQ(toString(ReferenceErrorKind::FormatError), "FormatError");
    EXPECT_EQ(toString(ReferenceErrorKind::ChecksumError), "ChecksumError");
}

// ============================================================================
// Exception types
// ============================================================================

class ErrorTypeTest : public ::testing::Test {};

TEST_F(ErrorTypeTest, ValidationErrorIsInvalidArgument) {
    try {
        throw ValidationError(ValidationErrorKind::MissingIBAN, "Company IBAN is required");
    } catch (const std::invalid_argument& e) {
        EXPECT_STREQ(e.what(), "Company IBAN is required");
        auto* validation = dynamic_cast<const ValidationError*>(&e);
        ASSERT_NE(validation, nullptr);
        EXPECT_EQ(validation->kind(), ValidationErrorKind::MissingIBAN);
    }
}

TEST_F(ErrorTypeTest, ReferenceErrorCarriesType) {
    ReferenceError error(ReferenceErrorKind::FormatError, ReferenceType::SCOR, "bad");

    EXPECT_EQ(error.kind(), ReferenceErrorKind::FormatError);
    EXPECT_EQ(error.referenceType(), ReferenceType::SCOR);
    EXPECT_STREQ(error.what(), "bad");
}

TEST_F(ErrorTypeTest, ReferenceErrorCaughtAsStdException) {
    EXPECT_THROW(validateReference("", ReferenceType::SCOR), std::invalid_argument);
    EXPECT_THROW(validateReference("", ReferenceType::SCOR), std::exception);
}

TEST_F(ErrorTypeTest, MissingReferenceNamesType) {
    try {
        validateReference("", ReferenceType::SCOR);
        FAIL() << "Expected ReferenceError";
    } catch (const ReferenceError& e) {
        EXPECT_STREQ(e.what(), "Reference is required for type SCOR");
    }
}

TEST_F(ErrorTypeTest, IsValidReferenceDoesNotThrow) {
    EXPECT_NO_THROW((void)isValidReference("", ReferenceType::QRR));
    EXPECT_NO_THROW((void)isValidReference("RF00abc", ReferenceType::SCOR));
    EXPECT_FALSE(isValidReference("RF00abc", ReferenceType::SCOR));
}
