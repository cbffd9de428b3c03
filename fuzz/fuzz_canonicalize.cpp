/**
 * @file  fuzz_canonicalize.cpp
 * @brief libFuzzer target for nanp::phone::canonicalize / area_code / pretty / parse
 *
 * Build:
 *   cmake -DNANP_FUZZ=ON -DCMAKE_CXX_COMPILER=clang++ ..
 *   cmake --build . --target fuzz_canonicalize
 *
 * Run for 60 seconds:
 *   ./fuzz_canonicalize -max_total_time=60
 *
 * Invariants verified on every input:
 *   1. No crash, no UB.
 *   2. canonicalize() returns exactly 10 bytes.
 *   3. area_code() and pretty() are slices of canonicalize().
 *   4. If parse() returns a value, its digits equal canonicalize().
 */

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <string>
#include <string_view>

#include "nanp/phone.hpp"

using namespace nanp;
using namespace nanp::phone;

extern "C" int LLVMFuzzerTestOneInput(const uint8_t* data, size_t size) {
    const std::string_view raw(reinterpret_cast<const char*>(data), size);

    const std::string c = canonicalize(raw);
    assert(c.size() == constants::NUMBER_LENGTH);

    assert(area_code(raw) == c.substr(0, 3));
    assert(pretty(raw) ==
           "(" + c.substr(0, 3) + ") " + c.substr(3, 3) + "-" + c.substr(6, 4));

    const auto parsed = parse(raw);
    if (parsed.has_value()) {
        assert(parsed->digits() == c);
    }

    return 0;
}
