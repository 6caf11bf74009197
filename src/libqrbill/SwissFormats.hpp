/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Normalization, display formatting and plausibility checks for the
 * Swiss-specific fields of a QR-bill: IBAN, references, postal code, canton.
 *
 */

#pragma once

#include <string>

#include "ReferenceType.hpp"

namespace qr_bill {

/// Remove all whitespace and upper-case the rest
[[nodiscard]] std::string normalizeIban(const std::string &iban);

/**
 * True when the normalized IBAN is "CH" followed by 19 alphanumeric
 * characters. This is a form check only, see isValidIbanChecksum().
 */
[[nodiscard]] bool isSwissIbanForm(const std::string &iban);

/// "CH9300762011623852957" -> "CH93 0076 2011 6238 5295 7"
[[nodiscard]] std::string formatIban(const std::string &iban);

/**
 * Group a reference for printing on the payment slip.
 *
 * QRR references are grouped in fives from the right
 * ("21 00000 00003 13947 14300 09017"), SCOR references in fours from the
 * left ("RF18 5390 0754 7034"). NON references are returned unchanged.
 */
[[nodiscard]] std::string formatReference(const std::string &reference, ReferenceType type);

[[nodiscard]] bool isValidSwissPostalCode(const std::string &postalCode);

/// Two-letter canton abbreviation, case-insensitive
[[nodiscard]] bool isValidSwissCanton(const std::string &canton);

} // namespace qr_bill
