#pragma once

#include <variant>
#include <string>
#include <string_view>
#include <functional>
#include <stdexcept>
#include <type_traits>

namespace tagsync {

/**
 * Failure categories surfaced to callers.
 *
 * Validation and BusinessRule failures abort a command before anything is
 * written. Persistence failures come from the durable store. Sync failures
 * never leave the sync coordinator.
 */
enum class ErrorKind {
    Validation,
    BusinessRule,
    Persistence,
    Sync,
    Internal
};

[[nodiscard]] constexpr std::string_view error_kind_name(ErrorKind kind) noexcept {
    switch (kind) {
        case ErrorKind::Validation: return "validation";
        case ErrorKind::BusinessRule: return "business_rule";
        case ErrorKind::Persistence: return "persistence";
        case ErrorKind::Sync: return "sync";
        case ErrorKind::Internal: return "internal";
    }
    return "internal";
}

/**
 * Error type for Result - a message, a category and an optional code
 * (SQLite result code, HTTP status, ...).
 */
struct Error {
    std::string message;
    int code{0};
    ErrorKind kind{ErrorKind::Internal};

    Error() = default;
    explicit Error(std::string msg, int c = 0, ErrorKind k = ErrorKind::Internal)
        : message(std::move(msg)), code(c), kind(k) {}

    bool operator==(const Error& other) const {
        return message == other.message && code == other.code && kind == other.kind;
    }
};

[[nodiscard]] inline Error validation_error(std::string msg) {
    return Error(std::move(msg), 0, ErrorKind::Validation);
}

[[nodiscard]] inline Error business_error(std::string msg) {
    return Error(std::move(msg), 0, ErrorKind::BusinessRule);
}

[[nodiscard]] inline Error persistence_error(std::string msg, int code = 0) {
    return Error(std::move(msg), code, ErrorKind::Persistence);
}

[[nodiscard]] inline Error sync_error(std::string msg, int code = 0) {
    return Error(std::move(msg), code, ErrorKind::Sync);
}

/**
 * Result<T, E> - either a value (Ok) or an error (Err).
 *
 *   Result<Tag> load(const std::string& id) {
 *       if (id.empty()) return Result<Tag>::err(validation_error("empty id"));
 *       ...
 *   }
 *
 *   auto name = load(id).map([](const Tag& t) { return t.name; });
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
        return std::holds_alternative<T>(data_);
    }

    [[nodiscard]] bool is_err() const noexcept {
        return std::holds_alternative<E>(data_);
    }

    /**
     * Get the success value, throwing if this is an error.
     * Meant for tests and call sites that already checked is_ok().
     */
    [[nodiscard]] T& unwrap() & {
        throw_if_err();
        return std::get<T>(data_);
    }

    [[nodiscard]] const T& unwrap() const& {
        throw_if_err();
        return std::get<T>(data_);
    }

    [[nodiscard]] T unwrap() && {
        throw_if_err();
        return std::get<T>(std::move(data_));
    }

    [[nodiscard]] E& unwrap_err() & {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<E>(data_);
    }

    [[nodiscard]] const E& unwrap_err() const& {
        if (is_ok()) {
            throw std::runtime_error("Result::unwrap_err() called on success");
        }
        return std::get<E>(data_);
    }

    [[nodiscard]] T value_or(T default_value) const& {
        if (is_ok()) {
            return std::get<T>(data_);
        }
        return default_value;
    }

    [[nodiscard]] T value_or(T default_value) && {
        if (is_ok()) {
            return std::get<T>(std::move(data_));
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
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<T>(data_)));
        }
        return Result<U, E>::err(std::get<E>(data_));
    }

    template<typename F>
    [[nodiscard]] auto map(F&& f) && -> Result<std::invoke_result_t<F, T>, E> {
        using U = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return Result<U, E>::ok(std::invoke(std::forward<F>(f), std::get<T>(std::move(data_))));
        }
        return Result<U, E>::err(std::get<E>(std::move(data_)));
    }

    /**
     * map_err : Result<T, E> -> (E -> F) -> Result<T, F>
     */
    template<typename F>
    [[nodiscard]] auto map_err(F&& f) && -> Result<T, std::invoke_result_t<F, E>> {
        using NewE = std::invoke_result_t<F, E>;
        if (is_err()) {
            return Result<T, NewE>::err(std::invoke(std::forward<F>(f), std::get<E>(std::move(data_))));
        }
        return Result<T, NewE>::ok(std::get<T>(std::move(data_)));
    }

    /**
     * and_then : Result<T, E> -> (T -> Result<U, E>) -> Result<U, E>
     */
    template<typename F>
    [[nodiscard]] auto and_then(F&& f) const& -> std::invoke_result_t<F, const T&> {
        using ResultU = std::invoke_result_t<F, const T&>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<T>(data_));
        }
        return ResultU::err(std::get<E>(data_));
    }

    template<typename F>
    [[nodiscard]] auto and_then(F&& f) && -> std::invoke_result_t<F, T> {
        using ResultU = std::invoke_result_t<F, T>;
        if (is_ok()) {
            return std::invoke(std::forward<F>(f), std::get<T>(std::move(data_)));
        }
        return ResultU::err(std::get<E>(std::move(data_)));
    }

    /**
     * Run a side effect (usually logging) on error and pass the Result on.
     */
    template<typename F>
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), std::get<E>(data_));
        }
        return *this;
    }

private:
    template<size_t I, typename... Args>
    explicit Result(std::in_place_index_t<I> idx, Args&&... args)
        : data_(idx, std::forward<Args>(args)...) {}

    void throw_if_err() const {
        if (is_err()) {
            if constexpr (std::is_same_v<E, Error>) {
                throw std::runtime_error("Result::unwrap() called on error: " +
                                         std::get<E>(data_).message);
            } else {
                throw std::runtime_error("Result::unwrap() called on error");
            }
        }
    }

    std::variant<T, E> data_;
};

/**
 * Result<void, E> - success without a value, or an error.
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
    const Result& inspect_err(F&& f) const& {
        if (is_err()) {
            std::invoke(std::forward<F>(f), error_);
        }
        return *this;
    }

private:
    explicit Result(bool ok) : is_ok_(ok) {}
    explicit Result(E error) : is_ok_(false), error_(std::move(error)) {}

    bool is_ok_;
    E error_{};
};

template<typename T>
using Res = Result<T, Error>;

} // namespace tagsync
