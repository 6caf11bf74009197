/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Assembles QR-bill payloads from invoices.
 *
 */

#include <cmath>
#include <iostream>
#include <string>

#include "AdditionalInformation.hpp"
#include "Checksum.hpp"
#include "PayloadBuilder.hpp"
#include "QrBillConstants.hpp"
#include "ReferenceGenerator.hpp"
#include "ReferenceTypeSelector.hpp"
#include "ReferenceValidator.hpp"
#include "SwissFormats.hpp"

namespace qr_bill {

namespace {

// The trading name wins over the contact name when both are set
std::string displayName(const std::string &companyName, const std::string &name)
{
    return companyName.empty() ? name : companyName;
}

} // anonymous namespace

void PayloadBuilder::setWarningCb(std::function<void(const std::string &)> cb) { m_warningCb = cb; }

RandomSource &PayloadBuilder::random() const { return m_random ? *m_random : processRandomSource(); }

void PayloadBuilder::warn(const std::string &message) const
{
    if (m_warningCb) {
        m_warningCb(message);
    } else {
        std::cerr << "Warning: " << message << " (ignored)\n";
    }
}

std::optional<ValidationError> PayloadBuilder::findEligibilityProblem(const Invoice &invoice) const
{
    if (!invoice.company.has_value()) {
        return ValidationError{ValidationErrorKind::MissingCompanyInfo, "Company information is missing"};
    }

    if (!invoice.client.has_value()) {
        return ValidationError{ValidationErrorKind::MissingClientInfo, "Client information is missing"};
    }

    std::string iban = normalizeIban(invoice.company->iban);
    if (iban.empty()) {
        return ValidationError{ValidationErrorKind::MissingIBAN, "Company IBAN is required"};
    }

    if (!isSwissIbanForm(iban)) {
        return ValidationError{ValidationErrorKind::InvalidIBAN,
                               "Company IBAN must be a Swiss IBAN (CH followed by 19 alphanumeric characters)"};
    }

    if (m_strictIbanChecksum && !isValidIbanChecksum(iban)) {
        return ValidationError{ValidationErrorKind::InvalidIBAN, "Company IBAN checksum failed"};
    }

    if (!parseCurrency(invoice.currency).has_value()) {
        return ValidationError{ValidationErrorKind::UnsupportedCurrency, "Only CHF and EUR are supported for QR Bill"};
    }

    // written so that NaN is rejected too
    if (!(invoice.total > 0.0)) {
        return ValidationError{ValidationErrorKind::NonPositiveAmount, "Invoice total must be greater than 0"};
    }

    if (!std::isfinite(invoice.total)) {
        return ValidationError{ValidationErrorKind::NonPositiveAmount, "Invoice total must be a finite amount"};
    }

    return std::nullopt;
}

EligibilityResult PayloadBuilder::checkEligibility(const Invoice &invoice) const
{
    EligibilityResult result;

    auto problem = findEligibilityProblem(invoice);
    if (problem.has_value()) {
        result.valid = false;
        result.message = problem->what();
        result.kind = problem->kind();
    }

    return result;
}

void PayloadBuilder::reviewCreditorDetails(const CompanyInfo &company) const
{
    // in strict mode a bad checksum has already failed eligibility
    std::string iban = normalizeIban(company.iban);
    if (!m_strictIbanChecksum && !isValidIbanChecksum(iban)) {
        warn("Company IBAN " + formatIban(iban) + " fails the mod-97 checksum");
    }

    if (!company.address.country.empty() && company.address.country != SWISS_COUNTRY_CODE) {
        return;
    }

    if (!isValidSwissPostalCode(company.address.postalCode)) {
        warn("Company postal code '" + company.address.postalCode + "' is not a 4-digit Swiss postal code");
    }

    if (company.address.canton.has_value() && !isValidSwissCanton(company.address.canton.value())) {
        warn("Company canton '" + company.address.canton.value() + "' is not a Swiss canton");
    }
}

PaymentReference PayloadBuilder::resolveReference(const Invoice &invoice) const
{
    PaymentReference reference;
    reference.type = determineType(invoice.preferredReferenceType);

    if (invoice.storedReference.has_value() && !invoice.storedReference->empty()) {
        reference.value = invoice.storedReference.value();
    } else {
        reference.value = generateReference(reference.type, random());
    }

    validateReference(reference.value, reference.type);
    return reference;
}

QrBillPayload PayloadBuilder::buildFromInvoice(const Invoice &invoice) const
{
    auto problem = findEligibilityProblem(invoice);
    if (problem.has_value()) {
        throw problem.value();
    }

    const CompanyInfo &company = invoice.company.value();
    const ClientInfo &client = invoice.client.value();

    reviewCreditorDetails(company);

    QrBillPayload payload;

    payload.creditor.name = displayName(company.companyName, company.name);
    payload.creditor.address = company.address;
    payload.creditor.account = normalizeIban(company.iban);
    payload.creditor.country = company.address.country.empty() ? SWISS_COUNTRY_CODE : company.address.country;

    payload.debtor.name = displayName(client.companyName, client.name);
    payload.debtor.address = client.address;

    payload.payment.amount = invoice.total;
    payload.payment.currency = parseCurrency(invoice.currency).value();
    payload.payment.reference = resolveReference(invoice);
    payload.payment.additionalInformation = formatAdditionalInformation(invoice.invoiceNumber, invoice.notes);
    // reserved for alternative payment schemes, none are produced yet
    payload.payment.alternativeSchemes = std::nullopt;

    payload.invoice.number = invoice.invoiceNumber;
    payload.invoice.issueDate = invoice.issueDate;
    payload.invoice.dueDate = invoice.dueDate;
    payload.invoice.vatNumber = company.vatNumber;

    payload.items.reserve(invoice.items.size());
    for (const auto &item : invoice.items) {
        payload.items.push_back(DisplayLineItem{item.description, item.quantity, item.unitPrice, item.vatRate, item.total});
    }

    return payload;
}

} // namespace qr_bill
