/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The payment instruction handed to the QR code / PDF renderer.
 *
 * A payload is assembled on demand each time a QR-bill is requested and is
 * not persisted. Of its contents only the resolved reference is meant to be
 * stored by the caller, so that the next request for the same invoice reuses
 * it.
 *
 * Only the parties, the amount and the reference are authoritative payment
 * data. InvoiceSummary and the display items are informational copies for
 * the receipt.
 */

#pragma once

#include <ctime>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

#include "Party.hpp"
#include "ReferenceType.hpp"

namespace qr_bill {

struct PaymentReference {
    ReferenceType type{ReferenceType::NON};
    std::string value;
};

struct PaymentInfo {
    double amount{0.0};
    Currency currency{Currency::CHF};
    PaymentReference reference;
    std::optional<std::string> additionalInformation; // at most 140 characters
    std::optional<std::string> alternativeSchemes;    // reserved, never set

    void dump(std::ostream &outStream) const;
};

struct InvoiceSummary {
    std::string number;
    std::tm issueDate{};
    std::tm dueDate{};
    std::optional<std::string> vatNumber;

    void dump(std::ostream &outStream) const;
};

struct DisplayLineItem {
    std::string description;
    double quantity{0.0};
    double unitPrice{0.0};
    double vatRate{0.0};
    double total{0.0};
};

class QrBillPayload
{
  public:
    QrBillPayload() = default;
    virtual ~QrBillPayload() = default;

    virtual void dump(std::ostream &outStream) const;

  public:
    Creditor creditor;
    Party debtor;
    PaymentInfo payment;
    InvoiceSummary invoice;
    std::vector<DisplayLineItem> items;
};

} // namespace qr_bill
