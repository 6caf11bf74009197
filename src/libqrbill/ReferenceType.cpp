/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include "ReferenceType.hpp"

namespace qr_bill {

std::string toString(ReferenceType type)
{
    switch (type) {
    case ReferenceType::QRR:
        return "QRR";
    case ReferenceType::SCOR:
        return "SCOR";
    case ReferenceType::NON:
        return "NON";
    }
    return "";
}

std::string toString(Currency currency)
{
    switch (currency) {
    case Currency::CHF:
        return "CHF";
    case Currency::EUR:
        return "EUR";
    }
    return "";
}

std::optional<ReferenceType> parseReferenceType(const std::string &name)
{
    for (auto type : {ReferenceType::QRR, ReferenceType::SCOR, ReferenceType::NON}) {
        if (name == toString(type)) {
            return type;
        }
    }
    return std::nullopt;
}

std::optional<Currency> parseCurrency(const std::string &code)
{
    for (auto currency : {Currency::CHF, Currency::EUR}) {
        if (code == toString(currency)) {
            return currency;
        }
    }
    return std::nullopt;
}

std::ostream &operator<<(std::ostream &outStream, ReferenceType type) { return outStream << toString(type); }

std::ostream &operator<<(std::ostream &outStream, Currency currency) { return outStream << toString(currency); }

} // namespace qr_bill
