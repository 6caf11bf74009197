/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Accepts or rejects a payment reference against the rules of its type.
 *
 */

#pragma once

#include <string>

#include "ReferenceType.hpp"

namespace qr_bill {

/**
 * @brief Validate a reference against the grammar and checksum of its type.
 *
 * NON
 *      Always succeeds; the reference is ignored.
 *
 * QRR
 *      Must be non-empty, 16 to 27 decimal digits, and pass modulo10Check().
 *
 * SCOR
 *      Must be non-empty, "RF" + 2 digits + 1 to 19 characters of [A-Z0-9],
 *      and the two digits must equal iso11649CheckDigits("RF00" + payload),
 *      where payload is everything after the first four characters.
 *
 * Checks are applied in that order and the first failure is reported.
 *
 * @throws ReferenceError with kind MissingReference, FormatError or
 *         ChecksumError.
 */
void validateReference(const std::string &reference, ReferenceType type);

/**
 * Non-throwing variant of validateReference().
 */
[[nodiscard]] bool isValidReference(const std::string &reference, ReferenceType type);

} // namespace qr_bill
