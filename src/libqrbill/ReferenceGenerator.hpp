/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Produces fresh payment references for invoices that have none stored.
 *
 * QRR
 *      "00" followed by 14 random decimal digits (16 digits in total).
 *
 * SCOR
 *      "RF" followed by the first 19 characters of a random version 4 UUID,
 *      hyphens stripped and upper-cased.
 *
 * NON
 *      The empty string.
 *
 * Neither QRR nor SCOR computes a check value over what it produced, so a
 * generated reference is not guaranteed to pass validateReference(). Callers
 * that validate generated references must be prepared for a ReferenceError.
 * Uniqueness against previously issued references is not checked either;
 * that is the job of whatever stores the references.
 */

#pragma once

#include <string>

#include "RandomSource.hpp"
#include "ReferenceType.hpp"

namespace qr_bill {

[[nodiscard]] std::string generateReference(ReferenceType type, RandomSource &random);

/// Same as above, drawing from processRandomSource()
[[nodiscard]] std::string generateReference(ReferenceType type);

/**
 * RFC 4122 version 4 UUID in its canonical lower-case 8-4-4-4-12 form, built
 * from two draws of the random source.
 */
[[nodiscard]] std::string generateUuidV4(RandomSource &random);

} // namespace qr_bill
