/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cstring>
#include <string>
#include <vector>

#include "AdditionalInformation.hpp"
#include "QrBillConstants.hpp"

namespace qr_bill {

namespace {

// Continuation bytes of a UTF-8 sequence look like 10xxxxxx
bool isContinuationByte(char c) { return (static_cast<unsigned char>(c) & 0xC0) == 0x80; }

} // anonymous namespace

size_t utf8Length(const std::string &text)
{
    size_t count = 0;
    for (char c : text) {
        if (!isContinuationByte(c)) {
            ++count;
        }
    }
    return count;
}

std::string utf8Prefix(const std::string &text, size_t count)
{
    size_t seen = 0;
    for (size_t i = 0; i < text.size(); ++i) {
        if (!isContinuationByte(text[i])) {
            if (seen == count) {
                return text.substr(0, i);
            }
            ++seen;
        }
    }
    return text;
}

std::string truncateWithEllipsis(const std::string &text, size_t limit)
{
    if (utf8Length(text) <= limit) {
        return text;
    }
    size_t ellipsisLength = std::strlen(ADDITIONAL_INFO_ELLIPSIS);
    return utf8Prefix(text, limit - ellipsisLength) + ADDITIONAL_INFO_ELLIPSIS;
}

std::string formatAdditionalInformation(const std::string &invoiceNumber, const std::optional<std::string> &notes)
{
    std::vector<std::string> parts;
    parts.push_back("Invoice: " + invoiceNumber);

    if (notes.has_value() && !notes->empty()) {
        parts.push_back("Note: " + utf8Prefix(notes.value(), ADDITIONAL_INFO_NOTES_MAX_LENGTH));
    }

    std::string info;
    for (size_t i = 0; i < parts.size(); ++i) {
        if (i > 0) {
            info += ADDITIONAL_INFO_SEPARATOR;
        }
        info += parts[i];
    }

    return truncateWithEllipsis(info, ADDITIONAL_INFO_MAX_LENGTH);
}

} // namespace qr_bill
