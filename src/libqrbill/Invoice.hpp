/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief The invoice aggregate a QR-bill is built from.
 *
 * These types are filled by whatever persists invoices (or by InvoiceReader);
 * this library only reads them. Optional members model data the invoicing
 * layer may not have yet, e.g. an invoice whose client was deleted.
 */

#pragma once

#include <ctime>
#include <optional>
#include <string>
#include <vector>

#include "Party.hpp"

namespace qr_bill {

struct CompanyInfo {
    std::string name;        // contact name
    std::string companyName; // trading name, preferred when set
    std::string iban;
    std::optional<std::string> vatNumber;
    Address address;
};

struct ClientInfo {
    std::string name;
    std::string companyName;
    Address address;
};

struct InvoiceItem {
    std::string description;
    double quantity{0.0};
    double unitPrice{0.0};
    double vatRate{0.0};
    double total{0.0};
};

struct Invoice {
    std::string invoiceNumber;
    std::tm issueDate{};
    std::tm dueDate{};

    std::optional<CompanyInfo> company;
    std::optional<ClientInfo> client;

    std::string currency; // "CHF" or "EUR" to be eligible
    double total{0.0};
    std::vector<InvoiceItem> items;
    std::optional<std::string> notes;

    // Reference kept from an earlier QR-bill for this invoice, if any
    std::optional<std::string> storedReference;
    // Reference type requested by the user; unrecognized names fall back to QRR
    std::optional<std::string> preferredReferenceType;
};

} // namespace qr_bill
