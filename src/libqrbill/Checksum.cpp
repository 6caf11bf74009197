/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Check-digit algorithms for QR and creditor references.
 *
 */

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>

#include "Checksum.hpp"
#include "QrBillConstants.hpp"

namespace qr_bill {

namespace {

bool isUpperAlpha(char c) { return c >= 'A' && c <= 'Z'; }

bool isDigit(char c) { return c >= '0' && c <= '9'; }

// Fold one more decimal digit into a running mod-97 remainder.
unsigned int foldDigit(unsigned int remainder, unsigned int digit) { return (remainder * 10 + digit) % MOD97_MODULUS; }

// Fold a character in its ISO 7064 numeric form (A=10 .. Z=35, digits as is).
unsigned int foldChar(unsigned int remainder, char c)
{
    if (isDigit(c)) {
        return foldDigit(remainder, static_cast<unsigned int>(c - '0'));
    }
    unsigned int value = static_cast<unsigned int>(c - 'A') + 10;
    remainder = foldDigit(remainder, value / 10);
    return foldDigit(remainder, value % 10);
}

} // anonymous namespace

bool modulo10Check(const std::string &digits)
{
    unsigned int sum = 0;
    size_t pos = 0;

    for (auto it = digits.rbegin(); it != digits.rend(); ++it, ++pos) {
        if (!isDigit(*it)) {
            return false;
        }

        unsigned int digit = static_cast<unsigned int>(*it - '0');
        if (pos % 2 == 0) {
            digit *= 2;
            if (digit > 9) {
                digit = (digit % 10) + (digit / 10);
            }
        }
        sum += digit;
    }

    return sum % 10 == 0;
}

std::string iso11649CheckDigits(const std::string &reference)
{
    unsigned int remainder = 0;

    for (size_t i = 0; i < reference.size(); ++i) {
        char c = reference[i];
        if (!isDigit(c) && !isUpperAlpha(c)) {
            std::stringstream msg;
            msg << "invalid character in creditor reference: position " << i;
            throw std::invalid_argument{msg.str()};
        }
        remainder = foldChar(remainder, c);
    }

    unsigned int check = MOD97_CHECK_BASE - ((remainder * 100) % MOD97_MODULUS);

    std::ostringstream out;
    out << std::setfill('0') << std::setw(2) << check;
    return out.str();
}

std::string completeCreditorReference(const std::string &payload)
{
    if (payload.empty() || payload.size() > SCOR_MAX_PAYLOAD_LENGTH) {
        std::stringstream msg;
        msg << "creditor reference payload must have 1 to " << SCOR_MAX_PAYLOAD_LENGTH << " characters: got "
            << payload.size();
        throw std::invalid_argument{msg.str()};
    }

    std::string prefix{SCOR_PREFIX};
    return prefix + iso11649CheckDigits(prefix + "00" + payload) + payload;
}

bool isValidIbanChecksum(const std::string &iban)
{
    if (iban.size() < 5) {
        return false;
    }

    // Move the country code and check digits to the end
    std::string rearranged = iban.substr(4) + iban.substr(0, 4);

    unsigned int remainder = 0;
    for (char c : rearranged) {
        if (!isDigit(c) && !isUpperAlpha(c)) {
            return false;
        }
        remainder = foldChar(remainder, c);
    }

    return remainder == 1;
}

} // namespace qr_bill
