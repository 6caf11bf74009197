/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <iomanip>
#include <iostream>

#include "QrBillPayload.hpp"
#include "SwissFormats.hpp"

namespace qr_bill {

void PaymentInfo::dump(std::ostream &outStream) const
{
    auto previousFlags = outStream.flags();
    auto previousPrecision = outStream.precision();

    outStream << "Payment:" << "\n    amount: " << std::fixed << std::setprecision(2) << amount
              << "\n    currency: " << currency << "\n    reference_type: " << reference.type
              << "\n    reference: " << formatReference(reference.value, reference.type);
    if (additionalInformation.has_value()) {
        outStream << "\n    additional_information: " << additionalInformation.value();
    }
    if (alternativeSchemes.has_value()) {
        outStream << "\n    alternative_schemes: " << alternativeSchemes.value();
    }
    outStream << "\n";

    outStream.flags(previousFlags);
    outStream.precision(previousPrecision);
}

void InvoiceSummary::dump(std::ostream &outStream) const
{
    outStream << "Invoice:" << "\n    number: " << number << "\n    issue_date: " << std::put_time(&issueDate, "%Y-%m-%d")
              << "\n    due_date: " << std::put_time(&dueDate, "%Y-%m-%d");
    if (vatNumber.has_value()) {
        outStream << "\n    vat_number: " << vatNumber.value();
    }
    outStream << "\n";
}

void QrBillPayload::dump(std::ostream &outStream) const
{
    creditor.dump(outStream);
    outStream << "Debtor:" << "\n    name: " << debtor.name;
    debtor.address.dump(outStream);
    payment.dump(outStream);
    invoice.dump(outStream);

    auto previousFlags = outStream.flags();
    auto previousPrecision = outStream.precision();

    outStream << "Items: " << items.size() << "\n";
    outStream << std::fixed << std::setprecision(2);
    for (const auto &item : items) {
        outStream << "    " << item.description << ", " << item.quantity << " x " << item.unitPrice << " @ "
                  << item.vatRate << "% = " << item.total << "\n";
    }

    outStream.flags(previousFlags);
    outStream.precision(previousPrecision);
}

} // namespace qr_bill
