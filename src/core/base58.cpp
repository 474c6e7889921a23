#include "core/base58.hpp"

#include <algorithm>

namespace nutty::base58 {

static_assert(ALPHABET.size() == BASE, "Alphabet must have one symbol per digit");
static_assert(digit_value(ZERO_DIGIT) == 0, "'1' is the zero digit");
static_assert(!is_alphabet_char('0') && !is_alphabet_char('O') &&
              !is_alphabet_char('I') && !is_alphabet_char('l'),
              "Ambiguous glyphs are excluded");

Res<std::string> encode(const BigInt& value, size_t min_width) {
    if (value < 0) {
        return Res<std::string>::err(
            Error{ErrorKind::Codec, "Invalid input: value must be non-negative"});
    }

    // Collect digits least-significant first, then reverse.
    std::string digits;
    BigInt remaining = value;
    while (remaining > 0) {
        const auto digit = static_cast<unsigned>(remaining % BASE);
        digits.push_back(ALPHABET[digit]);
        remaining /= BASE;
    }

    if (digits.size() < min_width) {
        digits.append(min_width - digits.size(), ZERO_DIGIT);
    }
    std::reverse(digits.begin(), digits.end());

    return Res<std::string>::ok(std::move(digits));
}

Res<BigInt> decode(std::string_view text) {
    if (text.empty()) {
        return Res<BigInt>::err(Error{ErrorKind::Codec, "Invalid input: empty string"});
    }

    BigInt result = 0;
    for (char c : text) {
        const int digit = digit_value(c);
        if (digit < 0) {
            return Res<BigInt>::err(Error{
                ErrorKind::Codec,
                "Invalid character '" + std::string(1, c) + "' in base58 string"});
        }
        result = result * BASE + digit;
    }

    return Res<BigInt>::ok(std::move(result));
}

} // namespace nutty::base58
