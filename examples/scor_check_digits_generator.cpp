// examples/scor_check_digits_generator.cpp
// Utility to complete creditor references (RFxx...) with their check digits

#include <iostream>
#include <stdexcept>
#include <string>

#include "Checksum.hpp"

namespace {
int emit(const std::string &payload)
{
    try {
        std::cout << qr_bill::completeCreditorReference(payload) << "\n";
    } catch (const std::invalid_argument &ex) {
        std::cerr << payload << ": " << ex.what() << std::endl;
        return 1;
    }
    return 0;
}
} // namespace

int main(int argc, char **argv)
{
    // Accept payload either from command-line argument or stdin
    if (argc > 1) {
        return emit(argv[1]);
    }

    std::cerr << "Enter reference payloads (upper-case letters and digits, without 'RF')." << std::endl;
    std::cerr << "Press Ctrl+D (Unix) or Ctrl+Z (Windows) to finish." << std::endl;

    int status = 0;
    std::string payload;
    while (std::getline(std::cin, payload)) {
        status |= emit(payload);
    }

    return status;
}
