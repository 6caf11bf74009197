/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <string>

#include "Checksum.hpp"
#include "Errors.hpp"
#include "QrBillConstants.hpp"
#include "ReferenceValidator.hpp"

namespace qr_bill {

namespace {

bool isDigit(char c) { return c >= '0' && c <= '9'; }

bool isUpperAlnum(char c) { return isDigit(c) || (c >= 'A' && c <= 'Z'); }

// 16 to 27 decimal digits
bool matchesQrrGrammar(const std::string &reference)
{
    if (reference.size() < QRR_MIN_LENGTH || reference.size() > QRR_MAX_LENGTH) {
        return false;
    }
    for (char c : reference) {
        if (!isDigit(c)) {
            return false;
        }
    }
    return true;
}

// RF\d{2}[A-Z0-9]{1,19}
bool matchesScorGrammar(const std::string &reference)
{
    if (reference.size() <= SCOR_HEADER_LENGTH || reference.size() > SCOR_HEADER_LENGTH + SCOR_MAX_PAYLOAD_LENGTH) {
        return false;
    }
    if (reference.compare(0, 2, SCOR_PREFIX) != 0 || !isDigit(reference[2]) || !isDigit(reference[3])) {
        return false;
    }
    for (size_t i = SCOR_HEADER_LENGTH; i < reference.size(); ++i) {
        if (!isUpperAlnum(reference[i])) {
            return false;
        }
    }
    return true;
}

void validateQrrReference(const std::string &reference)
{
    if (!matchesQrrGrammar(reference)) {
        throw ReferenceError{ReferenceErrorKind::FormatError, ReferenceType::QRR,
                             "Invalid QRR reference: must be 16-27 digits"};
    }

    if (!modulo10Check(reference)) {
        throw ReferenceError{ReferenceErrorKind::ChecksumError, ReferenceType::QRR,
                             "Invalid QRR reference: checksum failed"};
    }
}

void validateScorReference(const std::string &reference)
{
    if (!matchesScorGrammar(reference)) {
        throw ReferenceError{ReferenceErrorKind::FormatError, ReferenceType::SCOR,
                             "Invalid SCOR reference: must match RF\\d{2}[A-Z0-9]{1,19}"};
    }

    std::string checkDigits = reference.substr(2, 2);
    std::string payload = reference.substr(SCOR_HEADER_LENGTH);

    if (checkDigits != iso11649CheckDigits(std::string{SCOR_PREFIX} + "00" + payload)) {
        throw ReferenceError{ReferenceErrorKind::ChecksumError, ReferenceType::SCOR,
                             "Invalid SCOR reference: checksum failed"};
    }
}

} // anonymous namespace

void validateReference(const std::string &reference, ReferenceType type)
{
    if (type == ReferenceType::NON) {
        return;
    }

    if (reference.empty()) {
        throw ReferenceError{ReferenceErrorKind::MissingReference, type,
                             "Reference is required for type " + toString(type)};
    }

    switch (type) {
    case ReferenceType::QRR:
        validateQrrReference(reference);
        break;
    case ReferenceType::SCOR:
        validateScorReference(reference);
        break;
    case ReferenceType::NON:
        break;
    }
}

bool isValidReference(const std::string &reference, ReferenceType type)
{
    try {
        validateReference(reference, type);
    } catch (const ReferenceError &) {
        return false;
    }
    return true;
}

} // namespace qr_bill
