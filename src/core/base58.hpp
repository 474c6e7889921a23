#pragma once

#include "core/result.hpp"
#include "core/types.hpp"

#include <string>
#include <string_view>

namespace nutty::base58 {

/**
 * Bitcoin-style alphabet: digits and letters without 0, O, I and l.
 * Index in this string is the digit value, so '1' is zero.
 */
inline constexpr std::string_view ALPHABET =
    "123456789ABCDEFGHJKLMNPQRSTUVWXYZabcdefghijkmnopqrstuvwxyz";

inline constexpr int BASE = 58;

inline constexpr char ZERO_DIGIT = '1';

[[nodiscard]] constexpr int digit_value(char c) noexcept {
    for (size_t i = 0; i < ALPHABET.size(); ++i) {
        if (ALPHABET[i] == c) return static_cast<int>(i);
    }
    return -1;
}

[[nodiscard]] constexpr bool is_alphabet_char(char c) noexcept {
    return digit_value(c) >= 0;
}

/**
 * Encode a non-negative integer as big-endian base-58 digits, left-padded
 * with '1' to at least `min_width` characters. Zero encodes as `min_width`
 * zero digits. Negative values fail with ErrorKind::Codec.
 */
[[nodiscard]] Res<std::string> encode(const BigInt& value, size_t min_width);

/**
 * Decode a base-58 string back to its integer value. Fails on empty input
 * and on the first character outside the alphabet.
 */
[[nodiscard]] Res<BigInt> decode(std::string_view text);

} // namespace nutty::base58
