/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Turns an invoice into a QR-bill payment instruction.
 *
 */

#pragma once

#include <functional>
#include <optional>
#include <string>

#include "Errors.hpp"
#include "Invoice.hpp"
#include "QrBillPayload.hpp"
#include "RandomSource.hpp"

namespace qr_bill {

struct EligibilityResult {
    bool valid{true};
    std::optional<std::string> message;
    std::optional<ValidationErrorKind> kind;
};

class PayloadBuilder
{
  public:
    /// Generates references from processRandomSource()
    PayloadBuilder() = default;

    /// Generates references from `random`, which must outlive the builder
    explicit PayloadBuilder(RandomSource &random) : m_random(&random) {}

    virtual ~PayloadBuilder() = default;

    /**
     * Receives advisory warnings (IBAN checksum, postal code, canton). Without
     * a callback they are written to std::cerr.
     */
    virtual void setWarningCb(std::function<void(const std::string &)> cb);

    /**
     * Treat an IBAN that fails the ISO 13616 mod-97 check as an InvalidIBAN
     * error instead of a warning. Off by default. Postal code and canton
     * warnings are reported either way.
     */
    void setStrictIbanChecksum(bool strict) { m_strictIbanChecksum = strict; }

    /**
     * @brief Check whether a QR-bill can be built for the invoice.
     *
     * Reports the first problem found, in this order: missing company, missing
     * client, missing IBAN, non-Swiss IBAN, unsupported currency (anything but
     * CHF and EUR), total not greater than zero or not finite.
     */
    [[nodiscard]] EligibilityResult checkEligibility(const Invoice &invoice) const;

    /**
     * @brief Build the payment instruction for an invoice.
     *
     * Applies the same checks as checkEligibility() and throws on the first
     * failure, then resolves the reference (see resolveReference()) and
     * assembles creditor, debtor, payment, invoice summary and display items.
     *
     * @throws ValidationError if the invoice is not eligible
     * @throws ReferenceError if the resolved reference is invalid
     */
    [[nodiscard]] QrBillPayload buildFromInvoice(const Invoice &invoice) const;

    /**
     * @brief Pick the reference for an invoice and validate it.
     *
     * The reference type comes from determineType() on the invoice's
     * preference. A non-empty stored reference is reused as is; otherwise a
     * new one is generated for that type. Either way the value must pass
     * validateReference().
     *
     * @throws ReferenceError
     */
    [[nodiscard]] PaymentReference resolveReference(const Invoice &invoice) const;

  private:
    [[nodiscard]] std::optional<ValidationError> findEligibilityProblem(const Invoice &invoice) const;
    void reviewCreditorDetails(const CompanyInfo &company) const;
    void warn(const std::string &message) const;
    RandomSource &random() const;

  private:
    RandomSource *m_random{nullptr};
    bool m_strictIbanChecksum{false};
    std::function<void(const std::string &)> m_warningCb;
};

} // namespace qr_bill
