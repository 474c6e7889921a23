#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>
#include <utility>

namespace nutty {

/**
 * Failure categories reported by the identifier, index and transport layers.
 */
enum class ErrorKind {
    Codec,                // Base-58 encode/decode failure
    MalformedIdentifier,  // Wrong shape for a wire identifier or short code
    ChecksumMismatch,     // Transmitted short code disagrees with the UUID
    InvalidCharacter,     // Fractional index byte outside [33, 126]
    DegenerateInterval,   // between() on equal indices
    CyclicParent,         // Block moved under itself or a descendant
    Transport,            // Malformed JSON payload
    Configuration         // Unusable setting (unknown time zone, ...)
};

[[nodiscard]] constexpr std::string_view kind_name(ErrorKind kind) {
    switch (kind) {
        case ErrorKind::Codec: return "codec";
        case ErrorKind::MalformedIdentifier: return "malformed_identifier";
        case ErrorKind::ChecksumMismatch: return "checksum_mismatch";
        case ErrorKind::InvalidCharacter: return "invalid_character";
        case ErrorKind::DegenerateInterval: return "degenerate_interval";
        case ErrorKind::CyclicParent: return "cyclic_parent";
        case ErrorKind::Transport: return "transport";
        case ErrorKind::Configuration: return "configuration";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure category plus a human readable message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Codec};
    std::string message;

    Error() = default;
    Error(ErrorKind k, std::string msg) : kind(k), message(std::move(msg)) {}

    bool operator==(const Error&) const = default;
};

namespace detail {

[[noreturn]] inline void throw_unwrap_error(const Error& error) {
    throw std::runtime_error("Result::unwrap() called on error: " + error.message);
}

template<typename E>
[[noreturn]] void throw_unwrap_error(const E&) {
    throw std::runtime_error("Result::unwrap() called on error");
}

} // namespace detail

/**
 * Result<T, E> - either a successful value (ok) or an error (err).
 *
 * Every fallible operation in the library returns one of these instead of
 * throwing. Compose with map / and_then:
 *
 *   auto id = base58::decode(text)
 *       .and_then([](const BigInt& v) { return Uuid::from_integer(v); });
 */
template<typename T, typename E = Error>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result ok(T value) {
        return Result(std::in_place_index<0>, std::move(value));
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::in_place_index<1>, std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept { return data_.index() == 0; }
    [[nodiscard]] bool is_err() const noexcept { return data_.index() == 1; }

    /**
     * Get the success value, throwing std::runtime_error on an error.
     * Meant for tests and for call sites that already checked is_ok().
     */
    [[nodiscard]] T& unwrap() & {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        if (is_err()) detail::throw_unwrap_error(std::get<1>(data_));
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T fallback) const& {
        return is_ok() ? std::get<0>(data_) : std::move(fallback);
    }

    /**
     * map : Result<T, E> -> (T -> U) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto map(F&& f) const& -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(data_)));
        }
        return Result<U, E>::err(std::get<1>(data_));
    }

    /**
     * map_err : Result<T, E> -> (E -> G) -> Result<T, G>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const& -> Result<T, std::invoke_result_t<F, const E&>> {
        using G = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<T, G>::err(std::invoke(std::forward<F>(f), std::get<1>(data_)));
        }
        return Result<T, G>::ok(std::get<0>(data_));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(data_));
        }
        return ResultU::err(std::get<1>(data_));
    }

    template<typename OnOk, typename OnErr>
    [[nodiscard]] auto match(OnOk&& on_ok, OnErr&& on_err) const& {
        if (is_ok()) {
            return std::invoke(std::forward<OnOk>(on_ok), std::get<0>(data_));
        }
        return std::invoke(std::forward<OnErr>(on_err), std::get<1>(data_));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    // Index-based access so T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success carries no value.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() { return Result(true); }
    [[nodiscard]] static Result err(E error) { return Result(std::move(error)); }

    [[nodiscard]] bool is_ok() const noexcept { return ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !ok_; }

    void unwrap() const {
        if (!ok_) detail::throw_unwrap_error(error_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (ok_) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        if (ok_) {
            return std::invoke(std::forward<F>(f));
        }
        return std::invoke_result_t<F>::err(error_);
    }

private:
    explicit Result(bool ok) : ok_(ok) {}
    explicit Result(E error) : ok_(false), error_(std::move(error)) {}

    bool ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace nutty
