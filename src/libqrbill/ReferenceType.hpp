/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The reference flavours a QR-bill can carry, and the payment currencies.
 *
 * QRR
 *      Swiss QR reference, 16 to 27 digits with an embedded check digit.
 *
 * SCOR
 *      ISO 11649 structured creditor reference, "RF" + 2 check digits + up to
 *      19 alphanumeric characters.
 *
 * NON
 *      No reference at all.
 */

#pragma once

#include <iostream>
#include <optional>
#include <string>

namespace qr_bill {

enum class ReferenceType {
    QRR,
    SCOR,
    NON
};

enum class Currency {
    CHF,
    EUR
};

std::string toString(ReferenceType type);
std::string toString(Currency currency);

/**
 * Parse the canonical upper-case name of a reference type ("QRR", "SCOR",
 * "NON"). Anything else, including other spellings, yields std::nullopt.
 */
[[nodiscard]] std::optional<ReferenceType> parseReferenceType(const std::string &name);

/**
 * Parse "CHF" or "EUR". Anything else yields std::nullopt.
 */
[[nodiscard]] std::optional<Currency> parseCurrency(const std::string &code);

std::ostream &operator<<(std::ostream &outStream, ReferenceType type);
std::ostream &operator<<(std::ostream &outStream, Currency currency);

} // namespace qr_bill
