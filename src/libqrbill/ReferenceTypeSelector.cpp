/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "ReferenceTypeSelector.hpp"

namespace qr_bill {

ReferenceType determineType(std::nullopt_t) { return ReferenceType::QRR; }

ReferenceType determineType(const std::optional<ReferenceType> &preferred)
{
    if (!preferred.has_value()) {
        return ReferenceType::QRR;
    }

    switch (preferred.value()) {
    case ReferenceType::QRR:
    case ReferenceType::SCOR:
    case ReferenceType::NON:
        return preferred.value();
    }
    // a value cast from outside the enumerators
    return ReferenceType::QRR;
}

ReferenceType determineType(const std::optional<std::string> &preferred)
{
    if (!preferred.has_value()) {
        return ReferenceType::QRR;
    }
    return determineType(parseReferenceType(preferred.value()));
}

} // namespace qr_bill
