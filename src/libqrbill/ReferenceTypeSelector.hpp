/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Picks the reference flavour for a payment.
 *
 * The caller's preference wins when it names one of QRR, SCOR or NON.
 * Otherwise (no preference, or an unrecognized name) the result is QRR.
 * Nothing else, e.g. currency or debtor country, influences the choice.
 */

#pragma once

#include <optional>
#include <string>

#include "ReferenceType.hpp"

namespace qr_bill {

[[nodiscard]] ReferenceType determineType(std::nullopt_t);
[[nodiscard]] ReferenceType determineType(const std::optional<ReferenceType> &preferred);
[[nodiscard]] ReferenceType determineType(const std::optional<std::string> &preferred);

} // namespace qr_bill
