/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Exceptions raised while checking an invoice or a payment reference.
 *
 * Both derive from std::invalid_argument: every failure is caused by the
 * caller's input and is deterministic, so retrying with the same input
 * produces the same error. what() is meant to be shown to the end user as is.
 */

#pragma once

#include <stdexcept>
#include <string>

#include "ReferenceType.hpp"

namespace qr_bill {

enum class ValidationErrorKind {
    MissingCompanyInfo,
    MissingClientInfo,
    MissingIBAN,
    InvalidIBAN,
    UnsupportedCurrency,
    NonPositiveAmount
};

enum class ReferenceErrorKind {
    MissingReference,
    FormatError,
    ChecksumError
};

std::string toString(ValidationErrorKind kind);
std::string toString(ReferenceErrorKind kind);

/**
 * An invoice that cannot be turned into a QR-bill.
 */
class ValidationError : public std::invalid_argument
{
  public:
    ValidationError(ValidationErrorKind kind, const std::string &message);

    [[nodiscard]] ValidationErrorKind kind() const { return m_kind; }

  private:
    ValidationErrorKind m_kind;
};

/**
 * A payment reference that does not satisfy the grammar or checksum of its type.
 */
class ReferenceError : public std::invalid_argument
{
  public:
    ReferenceError(ReferenceErrorKind kind, ReferenceType type, const std::string &message);

    [[nodiscard]] ReferenceErrorKind kind() const { return m_kind; }
    [[nodiscard]] ReferenceType referenceType() const { return m_type; }

  private:
    ReferenceErrorKind m_kind;
    ReferenceType m_type;
};

} // namespace qr_bill
