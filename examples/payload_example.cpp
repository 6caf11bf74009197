/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Example building a QR-bill payment instruction for an invoice.
 *
 * With a file argument the invoice is read from it (see sample_invoice.txt),
 * otherwise a small invoice is put together in code. The example shows the
 * eligibility check, the warning callback and the error types thrown while
 * building.
 *
 * Compilation:
 *   g++ -std=c++17 -I../src/libqrbill payload_example.cpp -L../build -lqrbill -o payload_example
 *
 * Usage:
 *   ./payload_example [invoice_file]
 */

#include "Errors.hpp"
#include "InvoiceReader.hpp"
#include "PayloadBuilder.hpp"

#include <fstream>
#include <iostream>

using namespace qr_bill;

Invoice buildSampleInvoice()
{
    Invoice invoice;
    invoice.invoiceNumber = "2024-042";
    invoice.currency = "CHF";
    invoice.total = 250.0;
    invoice.notes = "Payable within 30 days";
    invoice.preferredReferenceType = "SCOR";
    // RF check digits as computed by iso11649CheckDigits()
    invoice.storedReference = "RF10ABC123";

    CompanyInfo company;
    company.companyName = "Muster AG";
    company.iban = "CH56 0483 5012 3456 7800 9";
    company.address.street = "Bahnhofstrasse 1";
    company.address.postalCode = "8001";
    company.address.city = "Zürich";
    company.address.country = "CH";
    invoice.company = company;

    ClientInfo client;
    client.name = "Hans Meier";
    client.address.street = "Marktgasse 5";
    client.address.postalCode = "3011";
    client.address.city = "Bern";
    client.address.country = "CH";
    invoice.client = client;

    invoice.items.push_back(InvoiceItem{"Workshop", 1.0, 250.0, 8.1, 250.0});
    return invoice;
}

int main(int argc, char *argv[])
{
    Invoice invoice;

    if (argc > 1) {
        std::ifstream inStream(argv[1]);
        if (!inStream.is_open()) {
            std::cerr << "Couldn't open " << argv[1] << "\n";
            return 1;
        }
        try {
            InvoiceReader reader;
            invoice = reader.read(inStream);
        } catch (const std::exception &ex) {
            std::cerr << argv[1] << ": " << ex.what() << "\n";
            return 1;
        }
    } else {
        invoice = buildSampleInvoice();
    }

    PayloadBuilder builder;
    builder.setWarningCb([](const std::string &msg) { std::cout << "advisory: " << msg << "\n"; });

    auto eligibility = builder.checkEligibility(invoice);
    if (!eligibility.valid) {
        std::cout << "Not eligible (" << toString(eligibility.kind.value()) << "): " << eligibility.message.value()
                  << "\n";
        return 1;
    }

    try {
        auto payload = builder.buildFromInvoice(invoice);
        payload.dump(std::cout);
    } catch (const ReferenceError &ex) {
        std::cerr << "Reference rejected (" << toString(ex.kind()) << "): " << ex.what() << "\n";
        return 1;
    } catch (const ValidationError &ex) {
        std::cerr << "Invoice rejected (" << toString(ex.kind()) << "): " << ex.what() << "\n";
        return 1;
    }

    return 0;
}
