/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Reads an invoice description from a text stream.
 *
 * The format is line oriented, one "key = value" per line. Blank lines and
 * lines starting with '#' are skipped. Keys are grouped by prefix:
 *
 *   invoice.number, invoice.issue_date, invoice.due_date (YYYY-MM-DD),
 *   invoice.currency, invoice.total, invoice.notes, invoice.reference,
 *   invoice.reference_type
 *
 *   company.name, company.company_name, company.iban, company.vat_number,
 *   company.street, company.city, company.postal_code, company.country,
 *   company.canton
 *
 *   client.name, client.company_name, client.street, client.city,
 *   client.postal_code, client.country, client.canton
 *
 *   item = description | quantity | unit price | vat rate | total
 *
 * Example:
 * @code
 *   invoice.number = 2024-001
 *   invoice.currency = CHF
 *   invoice.total = 100.00
 *   company.company_name = Muster AG
 *   company.iban = CH93 0076 2011 6238 5295 7
 *   client.name = Hans Meier
 *   item = Consulting | 1 | 100.00 | 8.1 | 100.00
 * @endcode
 *
 * A company or client section exists as soon as one of its keys appears.
 */

#pragma once

#include <istream>
#include <string>
#include <vector>

#include "Invoice.hpp"

namespace qr_bill {

class InvoiceReader
{
  public:
    InvoiceReader() = default;
    virtual ~InvoiceReader() = default;

    /**
     * @throws std::invalid_argument on an unknown key or a malformed value,
     *         with the line number in the message
     */
    [[nodiscard]] Invoice read(std::istream &stream);

  private:
    void applyLine(Invoice &invoice, int lineno, const std::string &key, const std::string &value);
    void applyAddressField(Address &address, int lineno, const std::string &field, const std::string &value);

    [[nodiscard]] double parseAmount(int lineno, const std::string &value);
    [[nodiscard]] std::tm parseDate(int lineno, const std::string &value);
    [[nodiscard]] InvoiceItem parseItem(int lineno, const std::string &value);
    [[nodiscard]] std::vector<std::string> splitItemFields(const std::string &value);
};

} // namespace qr_bill
