#pragma once

#include <variant>
#include <string>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace sheaf {

/**
 * ErrorKind - Classifies failures by how the engine reacts to them.
 *
 * Transient kinds are retried by the next scheduling tick; OversizedItem is the
 * only kind that is reported to the caller as a decision to make.
 */
enum class ErrorKind {
    Internal,
    InvalidInput,
    Io,
    TransientEncoding,
    TransientUpload,
    OversizedItem
};

[[nodiscard]] constexpr const char* error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Internal: return "internal";
        case ErrorKind::InvalidInput: return "invalid-input";
        case ErrorKind::Io: return "io";
        case ErrorKind::TransientEncoding: return "transient-encoding";
        case ErrorKind::TransientUpload: return "transient-upload";
        case ErrorKind::OversizedItem: return "oversized-item";
    }
    return "unknown";
}

/**
 * Error type for Result - a failure kind plus a human-readable message.
 */
struct Error {
    ErrorKind kind{ErrorKind::Internal};
    std::string message;

    Error() = default;
    explicit Error(std::string msg, ErrorKind k = ErrorKind::Internal)
        : kind(k), message(std::move(msg)) {}

    [[nodiscard]] bool is_transient() const noexcept {
        return kind == ErrorKind::TransientEncoding || kind == ErrorKind::TransientUpload;
    }

    bool operator==(const Error& other) const {
        return kind == other.kind && message == other.message;
    }
};

/**
 * Result<T, E> - Either a value (Ok) or an error (Err).
 *
 * Every call into an external collaborator (encoder, remote store, filesystem)
 * reports through this type so callers decide between retry, discard and
 * surfacing without exceptions crossing component boundaries.
 *
 * Usage:
 *   Result<qint64> verified = measure(batch);
 *   auto fits = verified.map([&](qint64 bytes) { return bytes < limit; });
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
     * Intended for tests and top-level tools; engine code branches on is_ok().
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<0>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
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

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<0>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<1>(std::move(data_)));
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

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<0>(std::move(data_)));
        }
        return ResultU::err(std::get<1>(std::move(data_)));
    }

    /**
     * Run a side effect (usually logging) on error and pass the Result through.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<1>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_ok()) return;
        if constexpr (std::is_same_v<E, Error>) {
            throw std::runtime_error("Result::unwrap() called on error: " +
                                     std::get<1>(data_).message);
        } else {
            throw std::runtime_error("Result::unwrap() called on error");
        }
    }

    // Indexed rather than type-selected so Result<std::string, std::string> works.
    std::variant<T, E> data_;
};

/**
 * Specialization for operations that succeed without a value.
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

    [[nodiscard]] bool is_ok() const noexcept { return is_ok_; }
    [[nodiscard]] bool is_err() const noexcept { return !is_ok_; }

    void unwrap() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " + error_.message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
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

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace sheaf
