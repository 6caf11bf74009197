/**
 * Copyright @ 2024 Michel Hoche-Mong
 * SPDX-License-Identifier: CC-BY-4.0
 *
 * @brief Command line tool for QR-bill payment references.
 *
 * Validates, generates and completes references, and builds the payment
 * instruction for invoice description files.
 */

#include <cstdint>
#include <cstring>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <system_error>
#include <vector>

#ifdef _WIN32
#include "getopt.h"
#else
#include <unistd.h>
#endif

#include "libqrbill/Checksum.hpp"
#include "libqrbill/Errors.hpp"
#include "libqrbill/InvoiceReader.hpp"
#include "libqrbill/PayloadBuilder.hpp"
#include "libqrbill/RandomSource.hpp"
#include "libqrbill/ReferenceGenerator.hpp"
#include "libqrbill/ReferenceTypeSelector.hpp"
#include "libqrbill/ReferenceValidator.hpp"
#include "libqrbill/SwissFormats.hpp"

using namespace qr_bill;

static bool g_verbose = false;

struct Options {
    std::optional<std::string> type;
    std::optional<std::string> referenceToCheck;
    std::optional<std::string> scorPayload;
    std::optional<uint64_t> seed;
    bool generate{false};
    unsigned long count{1};
    bool grouped{false};
    bool strictIban{false};
    std::string outputFile;
    std::vector<std::string> invoiceFiles;
};

std::string displayReference(const std::string &reference, ReferenceType type, bool grouped)
{
    return grouped ? formatReference(reference, type) : reference;
}

int checkReference(const std::string &reference, ReferenceType type, std::ostream &outStream)
{
    try {
        validateReference(reference, type);
    } catch (const ReferenceError &ex) {
        std::cerr << ex.what() << "\n";
        if (g_verbose) {
            std::cerr << "    kind: " << toString(ex.kind()) << "\n";
        }
        return 1;
    }

    outStream << reference << ": valid " << type << " reference\n";
    return 0;
}

int completeScorReference(const std::string &payload, bool grouped, std::ostream &outStream)
{
    std::string reference;
    try {
        reference = completeCreditorReference(payload);
    } catch (const std::invalid_argument &ex) {
        std::cerr << "Error: " << ex.what() << "\n";
        return 1;
    }

    outStream << displayReference(reference, ReferenceType::SCOR, grouped) << "\n";
    return 0;
}

int generateReferences(ReferenceType type, const Options &opts, std::ostream &outStream)
{
    std::optional<Mt19937RandomSource> seeded;
    if (opts.seed.has_value()) {
        seeded.emplace(opts.seed.value());
    }
    RandomSource &random = seeded.has_value() ? static_cast<RandomSource &>(seeded.value()) : processRandomSource();

    for (unsigned long i = 0; i < opts.count; ++i) {
        std::string reference = generateReference(type, random);
        outStream << displayReference(reference, type, opts.grouped);
        if (g_verbose) {
            outStream << (isValidReference(reference, type) ? "  (passes validation)" : "  (fails validation)");
        }
        outStream << "\n";
    }
    return 0;
}

int processInvoice(const std::string &filename, const PayloadBuilder &builder, std::ostream &outStream)
{
    std::filesystem::path inputFilePath{filename};
    std::error_code ec;

    auto length = std::filesystem::file_size(inputFilePath, ec);
    if (ec.value() != 0) {
        std::cerr << filename << ": No such file\n";
        return 1;
    }
    if (length == 0) {
        std::cerr << filename << ": Empty file\n";
        return 1;
    }

    std::ifstream inStream(filename);
    if (!inStream.is_open()) {
        std::cerr << filename << ": Couldn't open file\n";
        return 1;
    }

    Invoice invoice;
    try {
        InvoiceReader reader;
        invoice = reader.read(inStream);
    } catch (const std::exception &ex) {
        std::cerr << filename << ": " << ex.what() << "\n";
        return 1;
    }

    auto eligibility = builder.checkEligibility(invoice);
    if (!eligibility.valid) {
        std::cerr << filename << ": " << eligibility.message.value_or("not eligible for a QR-bill") << "\n";
        return 1;
    }

    try {
        auto payload = builder.buildFromInvoice(invoice);
        if (g_verbose) {
            outStream << "Built QR-bill for invoice " << invoice.invoiceNumber << " from " << filename << "\n";
        }
        payload.dump(outStream);
    } catch (const std::invalid_argument &ex) {
        std::cerr << filename << ": " << ex.what() << "\n";
        return 1;
    }

    return 0;
}

void showHelp(char *progName)
{
    std::cout << "Usage: " << progName << " [options] [invoicefile...]" << std::endl;
    std::cout << "Options:" << std::endl;
    std::cout << "    -h              print this help" << std::endl;
    std::cout << "    -t <type>       reference type: QRR, SCOR or NON (default QRR)" << std::endl;
    std::cout << "    -c <reference>  validate a reference against its type" << std::endl;
    std::cout << "    -g              generate references" << std::endl;
    std::cout << "    -n <count>      number of references to generate (default 1)" << std::endl;
    std::cout << "    -s <seed>       seed for reproducible generation" << std::endl;
    std::cout << "    -d <payload>    complete a creditor reference with its RF check digits" << std::endl;
    std::cout << "    -f              print references in grouped display form" << std::endl;
    std::cout << "    -S              reject IBANs failing the mod-97 checksum" << std::endl;
    std::cout << "    -o <filename>   output to a file" << std::endl;
    std::cout << "    -v              verbose output" << std::endl;
}

std::optional<unsigned long long> parseUnsigned(const char *arg, const char *what)
{
    try {
        size_t idx = 0;
        unsigned long long value = std::stoull(arg, &idx);
        if (idx != strlen(arg) || arg[0] == '-') {
            std::cerr << "Error: Invalid " << what << " (contains non-numeric characters): " << arg << std::endl;
            return std::nullopt;
        }
        return value;
    } catch (const std::invalid_argument &) {
        std::cerr << "Error: " << what << " must be a valid integer: " << arg << std::endl;
    } catch (const std::out_of_range &) {
        std::cerr << "Error: " << what << " out of range: " << arg << std::endl;
    }
    return std::nullopt;
}

int main(int argc, char *argv[])
{
    Options opts;

    int c;
    while ((c = getopt(argc, argv, "ht:c:gn:s:d:fSo:v")) != -1) {
        switch (c) {
        case 'h':
            showHelp(argv[0]);
            return 0;
        case 't':
            opts.type = optarg;
            break;
        case 'c':
            opts.referenceToCheck = optarg;
            break;
        case 'g':
            opts.generate = true;
            break;
        case 'n': {
            auto count = parseUnsigned(optarg, "count");
            if (!count.has_value() || count.value() == 0) {
                return 1;
            }
            opts.count = static_cast<unsigned long>(count.value());
        } break;
        case 's': {
            auto seed = parseUnsigned(optarg, "seed");
            if (!seed.has_value()) {
                return 1;
            }
            opts.seed = static_cast<uint64_t>(seed.value());
        } break;
        case 'd':
            opts.scorPayload = optarg;
            break;
        case 'f':
            opts.grouped = true;
            break;
        case 'S':
            opts.strictIban = true;
            break;
        case 'o':
            opts.outputFile = optarg;
            break;
        case 'v':
            g_verbose = true;
            break;
        default:
            showHelp(argv[0]);
            return 1;
        }
    }

    for (int i = optind; i < argc; ++i) {
        opts.invoiceFiles.push_back(argv[i]);
    }

    if (!opts.generate && !opts.referenceToCheck && !opts.scorPayload && opts.invoiceFiles.empty()) {
        showHelp(argv[0]);
        return 0;
    }

    if (opts.type.has_value() && !parseReferenceType(opts.type.value()).has_value()) {
        std::cerr << "Warning: unknown reference type '" << opts.type.value() << "', using QRR\n";
    }
    ReferenceType type = determineType(opts.type);

    std::ofstream outFileStream;
    if (!opts.outputFile.empty()) {
        outFileStream.open(opts.outputFile, std::ios::out | std::ios::trunc);
        if (!outFileStream.is_open()) {
            std::cerr << "Couldn't open output file\n";
            return 1;
        }
    }
    std::ostream &outStream = (opts.outputFile.empty() ? std::cout : outFileStream);

    int status = 0;

    if (opts.referenceToCheck.has_value()) {
        status |= checkReference(opts.referenceToCheck.value(), type, outStream);
    }

    if (opts.scorPayload.has_value()) {
        status |= completeScorReference(opts.scorPayload.value(), opts.grouped, outStream);
    }

    if (opts.generate) {
        status |= generateReferences(type, opts, outStream);
    }

    if (!opts.invoiceFiles.empty()) {
        PayloadBuilder builder;
        builder.setStrictIbanChecksum(opts.strictIban);

        for (auto &&filename : opts.invoiceFiles) {
            if (opts.invoiceFiles.size() > 1) {
                outStream << filename << std::endl;
            }
            status |= processInvoice(filename, builder, outStream);
        }
    }

    return status;
}
