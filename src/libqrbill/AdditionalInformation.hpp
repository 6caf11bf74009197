/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Builds the free-text "additional information" field of a QR-bill.
 *
 * Lengths are counted in characters (Unicode code points of the UTF-8 text),
 * and cuts never split a multi-byte sequence.
 */

#pragma once

#include <cstddef>
#include <optional>
#include <string>

namespace qr_bill {

/**
 * @brief Compose the additional information for an invoice.
 *
 * Starts with "Invoice: <number>". Non-empty notes are cut to their first 100
 * characters and appended as "Note: <notes>", joined with " - ". A result
 * longer than 140 characters is cut to 137 characters and "..." is appended,
 * so the returned string never exceeds 140 characters.
 */
[[nodiscard]] std::string formatAdditionalInformation(const std::string &invoiceNumber,
                                                      const std::optional<std::string> &notes);

/**
 * Cut `text` to at most `limit` characters, replacing the tail with "..." when
 * anything had to be removed. `limit` must be at least 3.
 */
[[nodiscard]] std::string truncateWithEllipsis(const std::string &text, size_t limit);

/// Number of code points in a UTF-8 string
[[nodiscard]] size_t utf8Length(const std::string &text);

/// The first `count` code points of a UTF-8 string
[[nodiscard]] std::string utf8Prefix(const std::string &text, size_t count);

} // namespace qr_bill
