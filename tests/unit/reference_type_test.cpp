/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * @brief Tests for reference type names and type selection
 */

#include <gtest/gtest.h>

#include <optional>
#include <sstream>
#include <string>

#include "ReferenceType.hpp"
#include "ReferenceTypeSelector.hpp"

using namespace qr_bill;

class ReferenceTypeTest : public ::testing::Test {};

TEST_F(ReferenceTypeTest, NamesRoundTrip) {
    EXPECT_EQ(toString(ReferenceType::QRR), "QRR");
    EXPECT_EQ(toString(ReferenceType::SCOR), "SCOR");
    EXPECT_EQ(toString(ReferenceType::NON), "NON");

    EXPECT_EQ(parseReferenceType("QRR"), ReferenceType::QRR);
    EXPECT_EQ(parseReferenceType("SCOR"), ReferenceType::SCOR);
    EXPECT_EQ(parseReferenceType("NON"), ReferenceType::NON);
}

TEST_F(ReferenceTypeTest, ParsingIsCaseSensitive) {
    EXPECT_FALSE(parseReferenceType("scor").has_value());
    EXPECT_FALSE(parseReferenceType(" QRR").has_value());
    EXPECT_FALSE(parseReferenceType("").has_value());
}

TEST_F(ReferenceTypeTest, CurrencyCodes) {
    EXPECT_EQ(parseCurrency("CHF"), Currency::CHF);
    EXPECT_EQ(parseCurrency("EUR"), Currency::EUR);
    EXPECT_FALSE(parseCurrency("USD").has_value());
    EXPECT_FALSE(parseCurrency("chf").has_value());
}

TEST_F(ReferenceTypeTest, StreamOutput) {
    std::ostringstream out;
    out << ReferenceType::SCOR << "/" << Currency::EUR;
    EXPECT_EQ(out.str(), "SCOR/EUR");
}

// ============================================================================
// determineType
// ============================================================================

class DetermineTypeTest : public ::testing::Test {};

TEST_F(DetermineTypeTest, DefaultsToQrr) {
    EXPECT_EQ(determineType(std::nullopt), ReferenceType::QRR);
    EXPECT_EQ(determineType(std::optional<std::string>{}), ReferenceType::QRR);
    EXPECT_EQ(determineType(std::optional<ReferenceType>{}), ReferenceType::QRR);
}

TEST_F(DetermineTypeTest, HonorsPreference) {
    EXPECT_EQ(determineType(std::optional<ReferenceType>{ReferenceType::SCOR}), ReferenceType::SCOR);
    EXPECT_EQ(determineType(std::optional<ReferenceType>{ReferenceType::NON}), ReferenceType::NON);
    EXPECT_EQ(determineType(std::optional<std::string>{"SCOR"}), ReferenceType::SCOR);
    EXPECT_EQ(determineType(std::optional<std::string>{"NON"}), ReferenceType::NON);
}

TEST_F(DetermineTypeTest, UnknownNameFallsBackToQrr) {
    EXPECT_EQ(determineType(std::optional<std::string>{"not-a-real-type"}), ReferenceType::QRR);
    EXPECT_EQ(determineType(std::optional<std::string>{""}), ReferenceType::QRR);
    EXPECT_EQ(determineType(std::optional<std::string>{"scor"}), ReferenceType::QRR);
}

TEST_F(DetermineTypeTest, ValueOutsideEnumeratorsFallsBackToQrr) {
    auto bogus = static_cast<ReferenceType>(7);
    EXPECT_EQ(determineType(std::optional<ReferenceType>{bogus}), ReferenceType::QRR);
}
