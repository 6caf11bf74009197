/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <cctype>
#include <iomanip>
#include <sstream>
#include <string>

#include "QrBillConstants.hpp"
#include "ReferenceGenerator.hpp"

namespace qr_bill {

namespace {

std::string generateQrrReference(RandomSource &random)
{
    std::string reference{QRR_GENERATED_PREFIX};
    for (size_t i = 0; i < QRR_GENERATED_RANDOM_DIGITS; ++i) {
        reference += static_cast<char>('0' + random.nextDigit());
    }
    return reference;
}

std::string generateScorReference(RandomSource &random)
{
    std::string uuid = generateUuidV4(random);

    std::string identifier;
    for (char c : uuid) {
        if (c != '-') {
            identifier += static_cast<char>(std::toupper(static_cast<unsigned char>(c)));
        }
    }

    return SCOR_PREFIX + identifier.substr(0, SCOR_GENERATED_CHARS);
}

} // anonymous namespace

std::string generateUuidV4(RandomSource &random)
{
    uint64_t data1 = random.next();
    uint64_t data2 = random.next();

    // version 4
    data1 = (data1 & 0xFFFFFFFFFFFF0FFFULL) | 0x0000000000004000ULL;
    // RFC 4122 variant
    data2 = (data2 & 0x3FFFFFFFFFFFFFFFULL) | 0x8000000000000000ULL;

    std::ostringstream oss;
    oss << std::hex << std::setfill('0');
    oss << std::setw(8) << ((data1 >> 32) & 0xFFFFFFFF) << '-';
    oss << std::setw(4) << ((data1 >> 16) & 0xFFFF) << '-';
    oss << std::setw(4) << (data1 & 0xFFFF) << '-';
    oss << std::setw(4) << ((data2 >> 48) & 0xFFFF) << '-';
    oss << std::setw(12) << (data2 & 0xFFFFFFFFFFFFULL);

    return oss.str();
}

std::string generateReference(ReferenceType type, RandomSource &random)
{
    switch (type) {
    case ReferenceType::QRR:
        return generateQrrReference(random);
    case ReferenceType::SCOR:
        return generateScorReference(random);
    case ReferenceType::NON:
        return "";
    }
    return "";
}

std::string generateReference(ReferenceType type) { return generateReference(type, processRandomSource()); }

} // namespace qr_bill
