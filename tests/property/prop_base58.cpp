#include <catch2/catch_test_macros.hpp>
#include <rapidcheck.h>
#include "core/base58.hpp"

#include <algorithm>
#include <tuple>

using namespace nutty;

namespace {

// Non-negative integers up to 192 bits, built from three 64-bit limbs.
rc::Gen<BigInt> wide_non_negative() {
    return rc::gen::map(
        rc::gen::tuple(rc::gen::arbitrary<uint64_t>(),
                       rc::gen::arbitrary<uint64_t>(),
                       rc::gen::arbitrary<uint64_t>(),
                       rc::gen::inRange(0, 3)),
        [](const std::tuple<uint64_t, uint64_t, uint64_t, int>& parts) {
            const auto& [lo, mid, hi, limbs] = parts;
            BigInt value = lo;
            if (limbs >= 1) value |= BigInt(mid) << 64;
            if (limbs >= 2) value |= BigInt(hi) << 128;
            return value;
        });
}

} // namespace

TEST_CASE("Property: decode inverts encode", "[property][base58]") {
    REQUIRE(rc::check("decode(encode(v, w)) == v",
        []() {
            const auto value = *wide_non_negative();
            const auto width = *rc::gen::inRange<size_t>(0, 40);

            auto encoded = base58::encode(value, width);
            RC_ASSERT(encoded.is_ok());
            RC_ASSERT(encoded.unwrap().size() >= width);

            if (encoded.unwrap().empty()) {
                RC_ASSERT(value == 0);
                return;
            }
            RC_ASSERT(base58::decode(encoded.unwrap()).unwrap() == value);
        }
    ));
}

TEST_CASE("Property: width only adds leading zero digits", "[property][base58]") {
    REQUIRE(rc::check("encode(v, w) is encode(v, 1) left-padded with '1'",
        [](uint64_t raw) {
            const BigInt value = raw;
            const auto width = *rc::gen::inRange<size_t>(1, 30);

            const auto minimal = base58::encode(value, 1).unwrap();
            const auto padded = base58::encode(value, width).unwrap();

            RC_ASSERT(padded.size() == std::max(width, minimal.size()));
            RC_ASSERT(padded.substr(padded.size() - minimal.size()) == minimal);
            RC_ASSERT(padded.find_first_not_of(base58::ZERO_DIGIT) >= padded.size() - minimal.size());
        }
    ));
}

TEST_CASE("Property: encoding is order preserving at fixed width", "[property][base58]") {
    REQUIRE(rc::check("a < b implies encode(a, 22) < encode(b, 22)",
        [](uint64_t a, uint64_t b) {
            RC_PRE(a != b);
            const auto ea = base58::encode(BigInt(a), 22).unwrap();
            const auto eb = base58::encode(BigInt(b), 22).unwrap();
            RC_ASSERT((a < b) == (ea < eb));
        }
    ));
}

TEST_CASE("Property: only alphabet characters are produced", "[property][base58]") {
    REQUIRE(rc::check("every output character is a base58 digit",
        []() {
            const auto value = *wide_non_negative();
            const auto encoded = base58::encode(value, 1).unwrap();
            for (char c : encoded) {
                RC_ASSERT(base58::is_alphabet_char(c));
            }
        }
    ));
}
