/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-NC-4.0
 *
 * @brief Tests for the additional information line of the payment part
 */

#include <gtest/gtest.h>

#include <optional>
#include <string>

#include "AdditionalInformation.hpp"

using namespace qr_bill;

namespace {
// "é" repeated, two bytes per code point
std::string accented(size_t count) {
    std::string s;
    for (size_t i = 0; i < count; ++i) {
        s += "\xC3\xA9";
    }
    return s;
}
} // namespace

class AdditionalInformationTest : public ::testing::Test {};

TEST_F(AdditionalInformationTest, InvoiceNumberOnly) {
    EXPECT_EQ(formatAdditionalInformation("2024-001", std::nullopt), "Invoice: 2024-001");
}

TEST_F(AdditionalInformationTest, EmptyNotesAreLeftOut) {
    EXPECT_EQ(formatAdditionalInformation("2024-001", std::string{}), "Invoice: 2024-001");
}

TEST_F(AdditionalInformationTest, NotesAreAppended) {
    EXPECT_EQ(formatAdditionalInformation("2024-001", std::string{"Thank you"}),
              "Invoice: 2024-001 - Note: Thank you");
}

TEST_F(AdditionalInformationTest, NotesCutToOneHundredCharacters) {
    std::string info = formatAdditionalInformation("2024-001", std::string(200, 'x'));

    EXPECT_EQ(info, "Invoice: 2024-001 - Note: " + std::string(100, 'x'));
    EXPECT_EQ(info.size(), 126u);
}

TEST_F(AdditionalInformationTest, ExactlyAtLimitIsKept) {
    // "Invoice: " is 9 characters
    std::string info = formatAdditionalInformation(std::string(131, 'A'), std::nullopt);

    EXPECT_EQ(info.size(), 140u);
    EXPECT_EQ(info, "Invoice: " + std::string(131, 'A'));
}

TEST_F(AdditionalInformationTest, BelowLimitIsKept) {
    std::string info = formatAdditionalInformation(std::string(130, 'A'), std::nullopt);

    EXPECT_EQ(info.size(), 139u);
}

TEST_F(AdditionalInformationTest, OverLimitGetsEllipsis) {
    std::string info = formatAdditionalInformation(std::string(132, 'A'), std::nullopt);

    EXPECT_EQ(info.size(), 140u);
    EXPECT_EQ(info, "Invoice: " + std::string(128, 'A') + "...");
}

TEST_F(AdditionalInformationTest, LongNumberAndNotes) {
    std::string info = formatAdditionalInformation(std::string(60, '9'), std::string(100, 'n'));

    // 9 + 60 + 3 + 6 + 100 = 178 before truncation
    EXPECT_EQ(info.size(), 140u);
    EXPECT_EQ(info.substr(137), "...");
    EXPECT_EQ(info.substr(0, 72), "Invoice: " + std::string(60, '9') + " - ");
}

TEST_F(AdditionalInformationTest, CountsCodePointsNotBytes) {
    std::string info = formatAdditionalInformation("2024-001", accented(150));

    EXPECT_EQ(info, "Invoice: 2024-001 - Note: " + accented(100));
    EXPECT_EQ(utf8Length(info), 126u);
}

class Utf8Test : public ::testing::Test {};

TEST_F(Utf8Test, LengthAndPrefix) {
    EXPECT_EQ(utf8Length(""), 0u);
    EXPECT_EQ(utf8Length("Z\xC3\xBCrich"), 6u);
    EXPECT_EQ(utf8Prefix("Z\xC3\xBCrich", 2), "Z\xC3\xBC");
    EXPECT_EQ(utf8Prefix("abc", 10), "abc");
    EXPECT_EQ(utf8Prefix("abc", 0), "");
}

TEST_F(Utf8Test, TruncateWithEllipsis) {
    EXPECT_EQ(truncateWithEllipsis("abc", 5), "abc");
    EXPECT_EQ(truncateWithEllipsis("abcde", 5), "abcde");
    EXPECT_EQ(truncateWithEllipsis("abcdef", 5), "ab...");
    EXPECT_EQ(truncateWithEllipsis(accented(6), 5), accented(2) + "...");
}
