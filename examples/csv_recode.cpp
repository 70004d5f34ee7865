/*
 * Copyright (c) 2025-2026 Tobias Weber <weber.tobias.md@gmail.com>
 *
 * This file is part of the CSVIO library.
 *
 * Licensed under the MIT License. See LICENSE file in the project root
 * for full license information.
 */

/**
 * @file csv_recode.cpp
 * @brief Read CSV from stdin in one dialect and write it to stdout in another.
 *
 * Example:
 *     csv_recode --in-delimiter ';' --out-tsv < data.csv > data.tsv
 */

#include <algorithm>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>

#include <csvio/csvio.h>

namespace {

struct Config {
    csvio::Dialect  input;
    csvio::Dialect  output;
    bool            verbose = false;
    bool            help = false;
};

void printUsage(const char* program_name) {
    std::cout << "Usage: " << program_name << " [OPTIONS] < INPUT > OUTPUT\n\n";
    std::cout << "Re-encode CSV data between dialects.\n\n";
    std::cout << "Input options:\n";
    std::cout << "  --in-delimiter CHAR    Field delimiter (default: ',')\n";
    std::cout << "  --in-quote CHAR        Quote character (default: '\"')\n";
    std::cout << "  --in-no-quote          Treat quote characters as data\n";
    std::cout << "  --in-terminator CHAR   Single-octet record terminator (default: CR, LF or CRLF)\n";
    std::cout << "  --in-keep-bom          Keep a leading byte order mark as data\n";
    std::cout << "Output options:\n";
    std::cout << "  --out-delimiter CHAR   Field delimiter (default: ',')\n";
    std::cout << "  --out-quote CHAR       Quote character (default: '\"')\n";
    std::cout << "  --out-terminator CHAR  Single-octet record terminator (default: CRLF)\n";
    std::cout << "  --out-bom              Write a byte order mark\n";
    std::cout << "  --out-tsv              Shorthand for tab delimiter and LF terminator\n";
    std::cout << "General:\n";
    std::cout << "  -v, --verbose          Print statistics to stderr\n";
    std::cout << "  -h, --help             Show this help message\n\n";
    std::cout << "CHAR may be a single character or one of: tab, lf, cr\n";
}

char parseChar(const std::string& value) {
    if (value == "tab" || value == "\\t") return '\t';
    if (value == "lf"  || value == "\\n") return '\n';
    if (value == "cr"  || value == "\\r") return '\r';
    if (value.size() != 1) {
        throw std::runtime_error("Expected a single character, got '" + value + "'");
    }
    return value[0];
}

Config parseArgs(int argc, char* argv[]) {
    Config config;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];

        auto nextValue = [&]() -> std::string {
            if (i + 1 >= argc) {
                throw std::runtime_error(arg + " requires an argument");
            }
            return argv[++i];
        };

        if (arg == "-h" || arg == "--help") {
            config.help = true;
            return config;
        } else if (arg == "-v" || arg == "--verbose") {
            config.verbose = true;
        } else if (arg == "--in-delimiter") {
            config.input.delimiter = parseChar(nextValue());
        } else if (arg == "--in-quote") {
            config.input.quote = parseChar(nextValue());
        } else if (arg == "--in-no-quote") {
            config.input.quote = std::nullopt;
        } else if (arg == "--in-terminator") {
            config.input.terminator = csvio::Terminator::octet(parseChar(nextValue()));
        } else if (arg == "--in-keep-bom") {
            config.input.bom = false;
        } else if (arg == "--out-delimiter") {
            config.output.delimiter = parseChar(nextValue());
        } else if (arg == "--out-quote") {
            config.output.quote = parseChar(nextValue());
        } else if (arg == "--out-terminator") {
            config.output.terminator = csvio::Terminator::octet(parseChar(nextValue()));
        } else if (arg == "--out-bom") {
            config.output.bom = true;
        } else if (arg == "--out-tsv") {
            config.output.delimiter = '\t';
            config.output.terminator = csvio::Terminator::octet('\n');
        } else {
            throw std::runtime_error("Unknown option: " + arg);
        }
    }

    if (config.input.hasCollisions()) {
        std::cerr << "Warning: input dialect uses the same character for more than one role" << std::endl;
    }
    if (config.output.hasCollisions()) {
        std::cerr << "Warning: output dialect uses the same character for more than one role" << std::endl;
    }
    return config;
}

} // namespace

int main(int argc, char* argv[]) {
    try {
        Config config = parseArgs(argc, argv);
        if (config.help) {
            printUsage(argv[0]);
            return 0;
        }

        std::ios::sync_with_stdio(false);

        csvio::Reader reader{csvio::IStreamSource{std::cin}, config.input};
        csvio::Writer writer{csvio::OStreamSink{std::cout}, config.output};
        csvio::Record record;

        size_t max_fields = 0;
        while (reader.readNext(record)) {
            writer.writeRecord(record.fields());
            max_fields = std::max(max_fields, record.fieldCount());
        }
        std::cout.flush();

        if (config.verbose) {
            std::cerr << "Records: " << reader.recordCount() << std::endl;
            std::cerr << "Physical lines: " << reader.lineNo() << std::endl;
            std::cerr << "Widest record: " << max_fields << " fields" << std::endl;
        }
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }

    return 0;
}
