/// @file src/main.cpp
/// @brief nanp CLI entry point.
///
/// Usage:
///   nanp --number <raw>      Canonical 10-digit number
///   nanp --area-code <raw>   Three-digit area code
///   nanp --pretty <raw>      "(AAA) EEE-SSSS"
///   nanp --strict <raw>      Pretty form, or exit 1 if the input is invalid
///   nanp --help              Print usage

#include "nanp/phone.hpp"

#include <fmt/core.h>

#include <cstdio>
#include <string>

namespace {

void print_usage(std::FILE* out) {
    fmt::print(out,
        "Usage:\n"
        "  nanp --number <raw>      Canonical 10-digit number\n"
        "  nanp --area-code <raw>   Three-digit area code\n"
        "  nanp --pretty <raw>      Formatted as (AAA) EEE-SSSS\n"
        "  nanp --strict <raw>      Formatted number; exit 1 if invalid\n"
        "  nanp --help              Show this help\n"
        "\n"
        "Invalid input prints 0000000000 except under --strict.\n"
    );
}

/// Returns 0 if `raw` parses, 1 otherwise.
int run_strict(const std::string& raw) {
    const auto parsed = nanp::phone::parse(raw);
    if (!parsed) {
        fmt::print(stderr, "Error: '{}' is not a valid NANP number\n", raw);
        return 1;
    }
    fmt::print("{}\n", parsed->to_string());
    return 0;
}

}  // anonymous namespace

int main(int argc, char* argv[]) {
    if (argc < 2) {
        print_usage(stderr);
        return 1;
    }

    const std::string mode(argv[1]);

    if (mode == "--help" || mode == "-h") {
        print_usage(stdout);
        return 0;
    }

    if (mode != "--number" && mode != "--area-code" &&
        mode != "--pretty" && mode != "--strict") {
        fmt::print(stderr, "Unknown option: {}\n", mode);
        print_usage(stderr);
        return 1;
    }

    if (argc < 3) {
        fmt::print(stderr, "Error: {} requires a phone number argument\n", mode);
        print_usage(stderr);
        return 1;
    }

    const std::string raw(argv[2]);

    if (mode == "--number") {
        fmt::print("{}\n", nanp::phone::number(raw));
    } else if (mode == "--area-code") {
        fmt::print("{}\n", nanp::phone::area_code(raw));
    } else if (mode == "--pretty") {
        fmt::print("{}\n", nanp::phone::pretty(raw));
    } else {
        return run_strict(raw);
    }
    return 0;
}
