/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "Errors.hpp"

namespace qr_bill {

std::string toString(ValidationErrorKind kind)
{
    switch (kind) {
    case ValidationErrorKind::MissingCompanyInfo:
        return "MissingCompanyInfo";
    case ValidationErrorKind::MissingClientInfo:
        return "MissingClientInfo";
    case ValidationErrorKind::MissingIBAN:
        return "MissingIBAN";
    case ValidationErrorKind::InvalidIBAN:
        return "InvalidIBAN";
    case ValidationErrorKind::UnsupportedCurrency:
        return "UnsupportedCurrency";
    case ValidationErrorKind::NonPositiveAmount:
        return "NonPositiveAmount";
    }
    return "";
}

std::string toString(ReferenceErrorKind kind)
{
    switch (kind) {
    case ReferenceErrorKind::MissingReference:
        return "MissingReference";
    case ReferenceErrorKind::FormatError:
        return "FormatError";
    case ReferenceErrorKind::ChecksumError:
        return "ChecksumError";
    }
    return "";
}

ValidationError::ValidationError(ValidationErrorKind kind, const std::string &message)
    : std::invalid_argument(message), m_kind(kind)
{
}

ReferenceError::ReferenceError(ReferenceErrorKind kind, ReferenceType type, const std::string &message)
    : std::invalid_argument(message), m_kind(kind), m_type(type)
{
}

} // namespace qr_bill
