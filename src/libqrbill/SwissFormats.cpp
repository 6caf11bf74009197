/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <algorithm>
#include <array>
#include <cctype>
#include <string>

#include "QrBillConstants.hpp"
#include "SwissFormats.hpp"

namespace qr_bill {

namespace {

const std::array<const char *, 26> SWISS_CANTONS = {"AG", "AI", "AR", "BE", "BL", "BS", "FR", "GE", "GL",
                                                    "GR", "JU", "LU", "NE", "NW", "OW", "SG", "SH", "SO",
                                                    "SZ", "TG", "TI", "UR", "VD", "VS", "ZG", "ZH"};

std::string stripWhitespace(const std::string &text)
{
    std::string cleaned;
    for (char c : text) {
        if (!std::isspace(static_cast<unsigned char>(c))) {
            cleaned += c;
        }
    }
    return cleaned;
}

std::string toUpperAscii(std::string text)
{
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

// Insert a space every `group` characters, counted from the left.
std::string groupFromLeft(const std::string &text, size_t group)
{
    std::string formatted;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i > 0 && i % group == 0) {
            formatted += ' ';
        }
        formatted += text[i];
    }
    return formatted;
}

// Insert a space every `group` characters, counted from the right.
std::string groupFromRight(const std::string &text, size_t group)
{
    std::string formatted;
    size_t lead = text.size() % group;
    for (size_t i = 0; i < text.size(); ++i) {
        if (i > 0 && (i + group - lead) % group == 0) {
            formatted += ' ';
        }
        formatted += text[i];
    }
    return formatted;
}

} // anonymous namespace

std::string normalizeIban(const std::string &iban) { return toUpperAscii(stripWhitespace(iban)); }

bool isSwissIbanForm(const std::string &iban)
{
    std::string cleaned = normalizeIban(iban);

    if (cleaned.size() != SWISS_IBAN_LENGTH || cleaned.compare(0, 2, SWISS_COUNTRY_CODE) != 0) {
        return false;
    }
    return std::all_of(cleaned.begin() + 2, cleaned.end(),
                       [](unsigned char c) { return std::isalnum(c) != 0; });
}

std::string formatIban(const std::string &iban) { return groupFromLeft(normalizeIban(iban), IBAN_DISPLAY_GROUP); }

std::string formatReference(const std::string &reference, ReferenceType type)
{
    switch (type) {
    case ReferenceType::QRR:
        return groupFromRight(stripWhitespace(reference), QRR_DISPLAY_GROUP);
    case ReferenceType::SCOR:
        return groupFromLeft(stripWhitespace(reference), SCOR_DISPLAY_GROUP);
    case ReferenceType::NON:
        return reference;
    }
    return reference;
}

bool isValidSwissPostalCode(const std::string &postalCode)
{
    std::string cleaned = stripWhitespace(postalCode);
    if (cleaned.size() != SWISS_POSTAL_CODE_LENGTH) {
        return false;
    }
    return std::all_of(cleaned.begin(), cleaned.end(), [](unsigned char c) { return std::isdigit(c) != 0; });
}

bool isValidSwissCanton(const std::string &canton)
{
    std::string upper = toUpperAscii(canton);
    return std::any_of(SWISS_CANTONS.begin(), SWISS_CANTONS.end(),
                       [&upper](const char *code) { return upper == code; });
}

} // namespace qr_bill
