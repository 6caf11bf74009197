/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Stateless check-digit algorithms used on payment references.
 *
 */

#pragma once

#include <string>

namespace qr_bill {

/**
 * @brief Luhn-style modulo 10 check over a complete digit string.
 *
 * The string is scanned from its least significant (rightmost) digit. Digits
 * at even positions, counting from 0 at the right end, are doubled and folded
 * back into a single digit when the result exceeds 9. The string passes when
 * the total is divisible by 10. The check digit is expected to be part of the
 * string already.
 *
 * An empty string sums to 0 and therefore passes. Any non-digit character
 * makes the check fail.
 */
[[nodiscard]] bool modulo10Check(const std::string &digits);

/**
 * @brief ISO 11649 check digits (ISO 7064 MOD 97-10) for a creditor reference.
 *
 * Letters A..Z are replaced by 10..35, digits are kept, and a running
 * remainder modulo 97 is folded over the resulting numeral. The result is
 * 98 - ((remainder * 100) mod 97), zero-padded to two digits.
 *
 * The caller passes the reference with its check-digit positions set to "00",
 * e.g. "RF00" + payload.
 *
 * @throws std::invalid_argument if the input contains anything other than
 *         upper-case letters and digits.
 */
[[nodiscard]] std::string iso11649CheckDigits(const std::string &reference);

/**
 * @brief ISO 13616 IBAN checksum: the rearranged numeral must be 1 modulo 97.
 *
 * Expects a normalized IBAN (no whitespace, upper case). Returns false for
 * anything that is not at least 5 alphanumeric characters.
 */
/**
 * @brief "RF" + check digits + payload, for a payload of 1 to 19 upper-case
 *        letters and digits.
 *
 * @throws std::invalid_argument on an empty or too long payload, or on an
 *         invalid character
 */
[[nodiscard]] std::string completeCreditorReference(const std::string &payload);

[[nodiscard]] bool isValidIbanChecksum(const std::string &iban);

} // namespace qr_bill
