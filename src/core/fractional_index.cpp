#include "core/fractional_index.hpp"

#include <algorithm>
#include <cstdio>
#include <vector>

namespace nutty {

static_assert(FractionalIndex::BASE == 94, "Base should be 94");

namespace {

// Digit value at position i, treating positions past the end as zero.
int digit_at(const std::string& index, size_t i) {
    if (i >= index.size()) return 0;
    return static_cast<unsigned char>(index[i]) - static_cast<unsigned char>(FractionalIndex::MIN_CHAR);
}

char to_char(int digit) {
    return static_cast<char>(FractionalIndex::MIN_CHAR + digit);
}

std::string describe_char(char c) {
    const auto code = static_cast<unsigned char>(c);
    char hex[8];
    std::snprintf(hex, sizeof(hex), "0x%02X", code);
    if (code >= 0x20 && code < 0x7F) {
        return "'" + std::string(1, c) + "' (" + hex + ")";
    }
    return hex;
}

} // namespace

Res<FractionalIndex> FractionalIndex::from_string(std::string_view index) {
    if (index.empty()) {
        return Res<FractionalIndex>::err(
            Error{ErrorKind::InvalidCharacter, "Invalid index: empty string"});
    }

    const auto it = std::find_if_not(index.begin(), index.end(), is_valid_char);
    if (it != index.end()) {
        return Res<FractionalIndex>::err(Error{
            ErrorKind::InvalidCharacter,
            "Invalid character: " + describe_char(*it) + " at position " +
                std::to_string(it - index.begin())});
    }

    return Res<FractionalIndex>::ok(FractionalIndex(std::string(index)));
}

Res<FractionalIndex> FractionalIndex::between(const FractionalIndex& before,
                                              const FractionalIndex& after) {
    if (before.compare(after) == 0) {
        return Res<FractionalIndex>::err(Error{
            ErrorKind::DegenerateInterval,
            "Identical indices: " + before.index_ + " === " + after.index_});
    }

    const auto& a = before.index_;
    const auto& b = after.index_;
    const size_t len = std::max(a.size(), b.size());

    // a + b, one base-94 digit per position, plus the integer part (0 or 1).
    std::vector<int> sum(len, 0);
    int overflow = 0;
    for (size_t i = len; i-- > 0;) {
        const int s = digit_at(a, i) + digit_at(b, i) + overflow;
        sum[i] = s % BASE;
        overflow = s / BASE;
    }

    // Halve from the most significant digit down. A remainder at one
    // position is worth BASE at the next; one left after the last digit
    // becomes a trailing half digit.
    std::string mean;
    mean.reserve(len + 1);
    int remainder = overflow;
    for (size_t i = 0; i < len; ++i) {
        const int s = remainder * BASE + sum[i];
        mean.push_back(to_char(s / 2));
        remainder = s % 2;
    }
    if (remainder != 0) {
        mean.push_back(to_char(BASE / 2));
    }

    return Res<FractionalIndex>::ok(FractionalIndex(std::move(mean)));
}

int FractionalIndex::compare(const FractionalIndex& other) const noexcept {
    const size_t len = std::max(index_.size(), other.index_.size());
    for (size_t i = 0; i < len; ++i) {
        const int lhs = digit_at(index_, i);
        const int rhs = digit_at(other.index_, i);
        if (lhs != rhs) return lhs < rhs ? -1 : 1;
    }
    return 0;
}

} // namespace nutty
