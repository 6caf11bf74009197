/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Field limits and constants of the Swiss QR-bill payment standard
 *
 * The values in this file are part of the clearing contract and must stay
 * bit-exact.
 */

#pragma once

#include <cstddef>

namespace qr_bill {

// ============================================================================
// QR reference (QRR)
// ============================================================================

/// Minimum number of digits in a QR reference
constexpr size_t QRR_MIN_LENGTH = 16;

/// Maximum number of digits in a QR reference
constexpr size_t QRR_MAX_LENGTH = 27;

/// Fixed prefix of generated QR references
constexpr const char *QRR_GENERATED_PREFIX = "00";

/// Number of random digits appended to the prefix of a generated QR reference
constexpr size_t QRR_GENERATED_RANDOM_DIGITS = 14;

/// Digits per group when displaying a QR reference
constexpr size_t QRR_DISPLAY_GROUP = 5;

// ============================================================================
// Creditor reference (SCOR, ISO 11649)
// ============================================================================

/// Every creditor reference starts with these two letters
constexpr const char *SCOR_PREFIX = "RF";

/// Length of "RF" plus the two check digits
constexpr size_t SCOR_HEADER_LENGTH = 4;

/// Maximum number of characters after the check digits
constexpr size_t SCOR_MAX_PAYLOAD_LENGTH = 19;

/// Number of identifier characters drawn for a generated creditor reference
constexpr size_t SCOR_GENERATED_CHARS = 19;

/// Characters per group when displaying a creditor reference
constexpr size_t SCOR_DISPLAY_GROUP = 4;

/// ISO 7064 MOD 97-10 parameters
constexpr unsigned int MOD97_MODULUS = 97;
constexpr unsigned int MOD97_CHECK_BASE = 98;

// ============================================================================
// Creditor account
// ============================================================================

/// Swiss IBANs are "CH" followed by 19 alphanumeric characters
constexpr size_t SWISS_IBAN_LENGTH = 21;
constexpr const char *SWISS_COUNTRY_CODE = "CH";

/// Characters per group when displaying an IBAN
constexpr size_t IBAN_DISPLAY_GROUP = 4;

/// Swiss postal codes have exactly four digits
constexpr size_t SWISS_POSTAL_CODE_LENGTH = 4;

// ============================================================================
// Additional information
// ============================================================================

/// Maximum length of the additional information field
constexpr size_t ADDITIONAL_INFO_MAX_LENGTH = 140;

/// Suffix appended when the additional information is cut
constexpr const char *ADDITIONAL_INFO_ELLIPSIS = "...";

/// Maximum number of note characters copied into the additional information
constexpr size_t ADDITIONAL_INFO_NOTES_MAX_LENGTH = 100;

/// Separator between the parts of the additional information
constexpr const char *ADDITIONAL_INFO_SEPARATOR = " - ";

} // namespace qr_bill
