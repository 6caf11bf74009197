/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The payee (creditor) and payer (debtor) of a payment instruction.
 *
 */

#pragma once

#include <iostream>
#include <optional>
#include <string>
#include <utility>

namespace qr_bill {

struct Address {
    std::string street;
    std::string city;
    std::string postalCode;
    std::string country;
    std::optional<std::string> canton;

    void dump(std::ostream &outStream) const;
};

class Party
{
  public:
    Party() = default;
    Party(std::string name, Address address) : name(std::move(name)), address(std::move(address)) {}
    virtual ~Party() = default;

    Party(const Party &) = default;
    Party &operator=(const Party &) = default;
    Party(Party &&) = default;
    Party &operator=(Party &&) = default;

    virtual void dump(std::ostream &outStream) const;

  public:
    std::string name;
    Address address;
};

/**
 * The invoice issuer. Always carries a Swiss IBAN.
 */
class Creditor : public Party
{
  public:
    Creditor() = default;

    void dump(std::ostream &outStream) const override;

  public:
    std::string account;       // IBAN, normalized
    std::string country{"CH"}; // ISO 3166 alpha-2
};

} // namespace qr_bill
