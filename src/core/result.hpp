#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace tally {

/**
 * Error type for Result - a stable machine-readable code plus a message
 * meant for the operator.
 *
 * Codes are short upper-case identifiers (see core/error_codes.hpp) and are
 * what travels over the wire; messages are free text.
 */
struct Error {
    std::string message;
    std::string code;

    Error() = default;
    explicit Error(std::string msg, std::string c = {})
        : message(std::move(msg)), code(std::move(c)) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code;
    }

    [[nodiscard]] std::string to_string() const {
        return code.empty() ? message : code + ": " + message;
    }
};

/**
 * Result<T, E> - either a successful value (Ok) or an error (Err).
 *
 * Usage:
 *   Result<int> parse_port(const std::string& s) {
 *       if (s.empty()) return Result<int>::err(Error{"empty port", "CONFIG"});
 *       return Result<int>::ok(std::stoi(s));
 *   }
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

    [[nodiscard]] bool is_ok() const noexcept {
        return data_.index() == 0;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return data_.index() == 1;
    }

    /**
     * Get the success value, throwing if this is an error.
     * Use sparingly - check is_ok() first on any path that can fail.
     */
    [[nodiscard]] T& unwrap() & {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        ensure_ok();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        ensure_ok();
        return std::get<0>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<1>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<0>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<0>(std::move(data_));
        }
        return default_value;
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
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    /**
     * Replace the error with a different one, keeping the value.
     * Used at layer boundaries to attach a domain code to a low-level failure.
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using NewE = std::invoke_result_t<F, E>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<1>(std::move(data_))));
        }
        return Result<T, NewE>::ok(std::get<0>(std::move(data_)));
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void ensure_ok() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).to_string());
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Index-based so that T and E may be the same type.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that either succeed with no value or fail.
 */
template<typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    [[nodiscard]] static Result ok() {
        return Result(true);
    }

    [[nodiscard]] static Result err(E error) {
        return Result(std::move(error));
    }

    [[nodiscard]] bool is_ok() const noexcept {
        return is_ok_;
    }

    [[nodiscard]] bool is_err() const noexcept {
        return !is_ok_;
    }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.to_string());
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return error_;
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const -> std::invoke_result_t<F> {
        using ResultU = std::invoke_result_t<F>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f));
        }
        return ResultU::err(error_);
    }

    template<typename F>
    [[nodiscard]] auto map_err(F&& f) const -> Result<void, std::invoke_result_t<F, const E&>> {
        using NewE = std::invoke_result_t<F, const E&>;
        if (is_err()) {
            return Result<void, NewE>::err(std::invoke(std::forward<F>(f), error_));
        }
        return Result<void, NewE>::ok();
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

/**
 * Early-return helper for Result<void, Error> chains.
 * Evaluates `expr`; if it failed, returns its error from the enclosing
 * function (which must return some Result<_, Error>).
 */
#define TALLY_TRY(ReturnType, expr)                                   \
    do {                                                              \
        auto tally_try_result_ = (expr);                              \
        if (tally_try_result_.is_err()) {                             \
            return ReturnType::err(tally_try_result_.unwrap_err());   \
        }                                                             \
    } while (false)

} // namespace tally
