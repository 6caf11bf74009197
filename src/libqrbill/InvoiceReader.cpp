/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Parses the line-oriented invoice description format.
 *
 */

#include <cctype>
#include <cmath>
#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <string>
#include <vector>

#include "InvoiceReader.hpp"

namespace qr_bill {

namespace {

constexpr size_t ITEM_FIELD_COUNT = 5;

std::string trim(const std::string &text)
{
    size_t first = 0;
    while (first < text.size() && std::isspace(static_cast<unsigned char>(text[first]))) {
        ++first;
    }
    size_t last = text.size();
    while (last > first && std::isspace(static_cast<unsigned char>(text[last - 1]))) {
        --last;
    }
    return text.substr(first, last - first);
}

// Plain decimal notation only; std::stod would also take "inf", "nan" and hex
bool isDecimalNumber(const std::string &value)
{
    if (value.empty()) {
        return false;
    }
    for (char c : value) {
        if (!std::isdigit(static_cast<unsigned char>(c)) && c != '.' && c != '+' && c != '-' && c != 'e' &&
            c != 'E') {
            return false;
        }
    }
    return true;
}

[[noreturn]] void throwLineError(int lineno, const std::string &what)
{
    std::stringstream msg;
    msg << what << ": line " << lineno;
    throw std::invalid_argument{msg.str()};
}

} // anonymous namespace

Invoice InvoiceReader::read(std::istream &stream)
{
    Invoice invoice;
    int lineno = 0;
    std::string line;

    while (std::getline(stream, line)) {
        lineno++;

        // strip off a trailing CR
        if (!line.empty() && line.back() == '\r') {
            line.pop_back();
        }

        std::string content = trim(line);
        if (content.empty() || content[0] == '#') {
            continue;
        }

        size_t eq = content.find('=');
        if (eq == std::string::npos || eq == 0) {
            throwLineError(lineno, "expected 'key = value'");
        }

        applyLine(invoice, lineno, trim(content.substr(0, eq)), trim(content.substr(eq + 1)));
    }

    if (stream.bad()) {
        std::stringstream msg;
        msg << "Couldn't read stream: line " << lineno;
        throw std::runtime_error{msg.str()};
    }

    return invoice;
}

void InvoiceReader::applyLine(Invoice &invoice, int lineno, const std::string &key, const std::string &value)
{
    if (key == "item") {
        invoice.items.push_back(parseItem(lineno, value));
        return;
    }

    size_t dot = key.find('.');
    if (dot == std::string::npos) {
        throwLineError(lineno, "unknown key '" + key + "'");
    }
    std::string section = key.substr(0, dot);
    std::string field = key.substr(dot + 1);

    if (section == "invoice") {
        if (field == "number") {
            invoice.invoiceNumber = value;
        } else if (field == "issue_date") {
            invoice.issueDate = parseDate(lineno, value);
        } else if (field == "due_date") {
            invoice.dueDate = parseDate(lineno, value);
        } else if (field == "currency") {
            invoice.currency = value;
        } else if (field == "total") {
            invoice.total = parseAmount(lineno, value);
        } else if (field == "notes") {
            invoice.notes = value;
        } else if (field == "reference") {
            invoice.storedReference = value;
        } else if (field == "reference_type") {
            invoice.preferredReferenceType = value;
        } else {
            throwLineError(lineno, "unknown key '" + key + "'");
        }
    } else if (section == "company") {
        if (!invoice.company.has_value()) {
            invoice.company.emplace();
        }
        CompanyInfo &company = invoice.company.value();
        if (field == "name") {
            company.name = value;
        } else if (field == "company_name") {
            company.companyName = value;
        } else if (field == "iban") {
            company.iban = value;
        } else if (field == "vat_number") {
            company.vatNumber = value;
        } else {
            applyAddressField(company.address, lineno, field, value);
        }
    } else if (section == "client") {
        if (!invoice.client.has_value()) {
            invoice.client.emplace();
        }
        ClientInfo &client = invoice.client.value();
        if (field == "name") {
            client.name = value;
        } else if (field == "company_name") {
            client.companyName = value;
        } else {
            applyAddressField(client.address, lineno, field, value);
        }
    } else {
        throwLineError(lineno, "unknown key '" + key + "'");
    }
}

void InvoiceReader::applyAddressField(Address &address, int lineno, const std::string &field, const std::string &value)
{
    if (field == "street") {
        address.street = value;
    } else if (field == "city") {
        address.city = value;
    } else if (field == "postal_code") {
        address.postalCode = value;
    } else if (field == "country") {
        address.country = value;
    } else if (field == "canton") {
        address.canton = value;
    } else {
        throwLineError(lineno, "unknown address field '" + field + "'");
    }
}

double InvoiceReader::parseAmount(int lineno, const std::string &value)
{
    double amount = 0.0;
    size_t pos = 0;

    if (!isDecimalNumber(value)) {
        throwLineError(lineno, "invalid number '" + value + "'");
    }

    try {
        amount = std::stod(value, &pos);
    } catch (const std::invalid_argument &) {
        throwLineError(lineno, "invalid number '" + value + "'");
    } catch (const std::out_of_range &) {
        std::stringstream msg;
        msg << "out of range number '" << value << "': line " << lineno;
        throw std::out_of_range{msg.str()};
    }

    if (pos != value.size() || !std::isfinite(amount)) {
        throwLineError(lineno, "invalid number '" + value + "'");
    }
    return amount;
}

std::tm InvoiceReader::parseDate(int lineno, const std::string &value)
{
    std::tm date{};
    std::istringstream in(value);
    in >> std::get_time(&date, "%Y-%m-%d");
    if (in.fail() || in.peek() != std::char_traits<char>::eof()) {
        throwLineError(lineno, "invalid date '" + value + "' (expected YYYY-MM-DD)");
    }
    return date;
}

std::vector<std::string> InvoiceReader::splitItemFields(const std::string &value)
{
    std::vector<std::string> fields;
    std::string rest = value;
    size_t pos = 0;

    while ((pos = rest.find('|')) != std::string::npos) {
        fields.push_back(trim(rest.substr(0, pos)));
        rest.erase(0, pos + 1);
    }
    fields.push_back(trim(rest));

    return fields;
}

InvoiceItem InvoiceReader::parseItem(int lineno, const std::string &value)
{
    auto fields = splitItemFields(value);
    if (fields.size() != ITEM_FIELD_COUNT) {
        throwLineError(lineno, "Incorrect number of fields in item");
    }

    InvoiceItem item;
    item.description = fields[0];
    item.quantity = parseAmount(lineno, fields[1]);
    item.unitPrice = parseAmount(lineno, fields[2]);
    item.vatRate = parseAmount(lineno, fields[3]);
    item.total = parseAmount(lineno, fields[4]);
    return item;
}

} // namespace qr_bill
