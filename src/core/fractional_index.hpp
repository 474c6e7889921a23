#pragma once

#include "core/result.hpp"

#include <compare>
#include <string>
#include <string_view>

namespace nutty {

/**
 * FractionalIndex - Order key for sibling content blocks.
 *
 * The key is a base-94 fraction written most significant digit first, one
 * printable ASCII character per digit ('!' = 0 ... '~' = 93). Missing
 * trailing digits count as '!', so "a" and "a!!" denote the same position.
 * A new key strictly between any two distinct keys always exists, which
 * lets a block move without renumbering its siblings.
 *
 * Keys can grow without bound under repeated insertion into the same gap.
 */
class FractionalIndex {
public:
    static constexpr char MIN_CHAR = '!';
    static constexpr char MAX_CHAR = '~';
    static constexpr int BASE = MAX_CHAR - MIN_CHAR + 1;

    /**
     * The smallest key, "!".
     */
    [[nodiscard]] static FractionalIndex start() { return FractionalIndex(std::string(1, MIN_CHAR)); }

    /**
     * The largest single-digit key, "~".
     */
    [[nodiscard]] static FractionalIndex end() { return FractionalIndex(std::string(1, MAX_CHAR)); }

    [[nodiscard]] static constexpr bool is_valid_char(char c) noexcept {
        const auto code = static_cast<unsigned char>(c);
        return code >= static_cast<unsigned char>(MIN_CHAR) &&
               code <= static_cast<unsigned char>(MAX_CHAR);
    }

    /**
     * Validate and wrap a stored key. Fails with ErrorKind::InvalidCharacter
     * naming the first byte outside [33, 126], or when the key is empty.
     */
    [[nodiscard]] static Res<FractionalIndex> from_string(std::string_view index);

    /**
     * The arithmetic mean of two keys. Argument order does not matter; the
     * result sorts strictly between them. Keys that compare equal fail with
     * ErrorKind::DegenerateInterval.
     */
    [[nodiscard]] static Res<FractionalIndex> between(const FractionalIndex& before,
                                                      const FractionalIndex& after);

    /**
     * A key between start() and this one. Fails when this key is already
     * the minimum.
     */
    [[nodiscard]] Res<FractionalIndex> before() const { return between(start(), *this); }

    /**
     * A key between this one and end(). Fails when this key equals end().
     */
    [[nodiscard]] Res<FractionalIndex> after() const { return between(*this, end()); }

    [[nodiscard]] const std::string& value() const noexcept { return index_; }

    /**
     * Compare with both keys right-padded with '!' to the same length.
     * Returns a negative, zero or positive value.
     */
    [[nodiscard]] int compare(const FractionalIndex& other) const noexcept;

    bool operator==(const FractionalIndex& other) const noexcept { return compare(other) == 0; }
    std::strong_ordering operator<=>(const FractionalIndex& other) const noexcept {
        return compare(other) <=> 0;
    }

private:
    explicit FractionalIndex(std::string index) : index_(std::move(index)) {}

    std::string index_;
};

} // namespace nutty
