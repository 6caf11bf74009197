/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 */

#include <iostream>

#include "Party.hpp"
#include "SwissFormats.hpp"

namespace qr_bill {

void Address::dump(std::ostream &outStream) const
{
    outStream << "\n    street: " << street << "\n    city: " << postalCode << " " << city
              << "\n    country: " << country;
    if (canton.has_value()) {
        outStream << "\n    canton: " << canton.value();
    }
    outStream << "\n";
}

void Party::dump(std::ostream &outStream) const
{
    outStream << "Party:" << "\n    name: " << name;
    address.dump(outStream);
}

void Creditor::dump(std::ostream &outStream) const
{
    outStream << "Creditor:" << "\n    name: " << name << "\n    account: " << formatIban(account)
              << "\n    country: " << country;
    address.dump(outStream);
}

} // namespace qr_bill
