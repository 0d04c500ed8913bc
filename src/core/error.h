#pragma once
// Copyright (c) 2024-2026 The FTC Developers
// Distributed under the MIT software license.

#include <cstdint>
#include <memory>
#include <source_location>
#include <stdexcept>
#include <string>
#include <string_view>
#include <type_traits>
#include <utility>
#include <variant>
#include <vector>

namespace scale::core {

// ErrorCode: diagnostic categories for codec failures.  The wire format
// only distinguishes success from failure; codes exist for logging.
enum class ErrorCode : uint16_t {
    NONE                 = 0,
    // Decoding (100-199)
    NOT_ENOUGH_DATA      = 100, INVALID_DISCRIMINANT = 101,
    OUT_OF_RANGE         = 102, INVALID_VALUE        = 103,
    TRAILING_DATA        = 104,
    // Limits (200-299)
    LENGTH_OVERFLOW      = 200, DEPTH_LIMIT          = 201,
    ALLOCATION_LIMIT     = 202,
    // Internal (900-999)
    INTERNAL_ERROR       = 900,
};

[[nodiscard]] std::string_view error_code_name(ErrorCode code) noexcept;

// Error: code, message and origin location, optionally wrapping the
// error that caused it.
class Error {
public:
    Error() noexcept : code_(ErrorCode::NONE) {}

    explicit Error(
        ErrorCode code,
        std::string message = {},
        std::source_location loc = std::source_location::current()) noexcept
        : code_(code), message_(std::move(message)), location_(loc) {}

    [[nodiscard]] ErrorCode          code()    const noexcept { return code_; }
    [[nodiscard]] const std::string& message() const noexcept { return message_; }
    [[nodiscard]] const std::source_location& location() const noexcept {
        return location_;
    }
    [[nodiscard]] const Error* cause() const noexcept { return cause_.get(); }
    [[nodiscard]] bool is_ok() const noexcept { return code_ == ErrorCode::NONE; }
    [[nodiscard]] explicit operator bool() const noexcept { return !is_ok(); }

    /// Wrap this error in a new one carrying @p desc.  The new error keeps
    /// the code of the root cause.
    [[nodiscard]] Error chain(std::string desc) const&;
    [[nodiscard]] Error chain(std::string desc) &&;

    /// Description chain, outermost first, one tab of indentation per
    /// level:  "outer:\n\tinner:\n\t\troot\n".
    [[nodiscard]] std::string what() const;

    /// Descriptions from the root cause outward.
    [[nodiscard]] std::vector<std::string> descriptions() const;

    [[nodiscard]] std::string format() const;

    bool operator==(const Error& o) const noexcept { return code_ == o.code_; }
    bool operator!=(const Error& o) const noexcept { return code_ != o.code_; }

private:
    ErrorCode                    code_;
    std::string                  message_;
    std::source_location         location_;
    std::shared_ptr<const Error> cause_;
};

// Result<T, E>: a sum type holding either a value T or an error E
template <typename T, typename E = Error>
class Result {
    static_assert(!std::is_same_v<T, E>,
                  "Result value and error types must differ");
public:
    using value_type = T;
    using error_type = E;

    Result(const T& val) : storage_(std::in_place_index<0>, val) {}            // NOLINT implicit
    Result(T&& val) : storage_(std::in_place_index<0>, std::move(val)) {}      // NOLINT implicit
    Result(const E& err) : storage_(std::in_place_index<1>, err) {}            // NOLINT implicit
    Result(E&& err) : storage_(std::in_place_index<1>, std::move(err)) {}      // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return storage_.index() == 0;
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    [[nodiscard]] T& value() & {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<0>(storage_);
    }
    [[nodiscard]] const T& value() const& {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<0>(storage_);
    }
    [[nodiscard]] T&& value() && {
        if (!ok()) throw std::runtime_error("Result::value() on error");
        return std::get<0>(std::move(storage_));
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<1>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<1>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<1>(std::move(storage_));
    }

    [[nodiscard]] T value_or(T default_val) const {
        return ok() ? std::get<0>(storage_) : std::move(default_val);
    }

    // map: Result<T,E> -> (T -> U) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto map(F&& func) const&
        -> Result<std::invoke_result_t<F, const T&>, E> {
        using U = std::invoke_result_t<F, const T&>;
        if (ok()) return Result<U, E>{func(std::get<0>(storage_))};
        return Result<U, E>{std::get<1>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto map(F&& func) &&
        -> Result<std::invoke_result_t<F, T&&>, E> {
        using U = std::invoke_result_t<F, T&&>;
        if (ok()) return Result<U, E>{func(std::get<0>(std::move(storage_)))};
        return Result<U, E>{std::get<1>(std::move(storage_))};
    }

    // map_error: attach context on the error path, e.g.
    //   r.map_error([](Error e) { return e.chain("Could not decode Foo"); })
    template <typename F>
    [[nodiscard]] Result map_error(F&& func) && {
        if (ok()) return std::move(*this);
        return Result{func(std::get<1>(std::move(storage_)))};
    }

    // and_then: Result<T,E> -> (T -> Result<U,E>) -> Result<U,E>
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F, const T&> {
        using R = std::invoke_result_t<F, const T&>;
        if (ok()) return func(std::get<0>(storage_));
        return R{std::get<1>(storage_)};
    }
    template <typename F>
    [[nodiscard]] auto and_then(F&& func) &&
        -> std::invoke_result_t<F, T&&> {
        using R = std::invoke_result_t<F, T&&>;
        if (ok()) return func(std::get<0>(std::move(storage_)));
        return R{std::get<1>(std::move(storage_))};
    }

    bool operator==(const Result& o) const { return storage_ == o.storage_; }

private:
    std::variant<T, E> storage_;
};

// Void-specialization: Result<void, E> for side-effect-only operations
template <typename E>
class Result<void, E> {
public:
    using value_type = void;
    using error_type = E;

    Result() noexcept : storage_(Void{}) {}
    Result(const E& err) : storage_(err) {}             // NOLINT implicit
    Result(E&& err) : storage_(std::move(err)) {}       // NOLINT implicit

    Result(const Result&)            = default;
    Result(Result&&) noexcept        = default;
    Result& operator=(const Result&) = default;
    Result& operator=(Result&&) noexcept = default;
    ~Result()                        = default;

    [[nodiscard]] bool has_value() const noexcept {
        return std::holds_alternative<Void>(storage_);
    }
    [[nodiscard]] bool ok() const noexcept { return has_value(); }
    [[nodiscard]] explicit operator bool() const noexcept { return ok(); }

    void value() const {
        if (!ok()) throw std::runtime_error("Result::value() on error");
    }
    [[nodiscard]] E& error() & {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] const E& error() const& {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(storage_);
    }
    [[nodiscard]] E&& error() && {
        if (ok()) throw std::runtime_error("Result::error() on value");
        return std::get<E>(std::move(storage_));
    }

    template <typename F>
    [[nodiscard]] Result map_error(F&& func) && {
        if (ok()) return std::move(*this);
        return Result{func(std::get<E>(std::move(storage_)))};
    }

    template <typename F>
    [[nodiscard]] auto and_then(F&& func) const&
        -> std::invoke_result_t<F> {
        if (ok()) return func();
        return std::invoke_result_t<F>{std::get<E>(storage_)};
    }

private:
    struct Void {};
    std::variant<Void, E> storage_;
};

// Factory helpers
[[nodiscard]] inline Error make_error(
    ErrorCode code,
    std::string message = {},
    std::source_location loc = std::source_location::current()) noexcept {
    return Error(code, std::move(message), loc);
}

template <typename T>
[[nodiscard]] inline Result<std::decay_t<T>> make_result(T&& val) {
    return Result<std::decay_t<T>>{std::forward<T>(val)};
}

[[nodiscard]] inline Result<void> make_ok() noexcept {
    return Result<void>{};
}

// SCALE_TRY: propagate errors (GCC/Clang statement-expression)
// Usage:  auto val = SCALE_TRY(some_result_expr);
#define SCALE_TRY(expr)                                                   \
    ({                                                                    \
        auto&& _scale_res = (expr);                                       \
        if (!_scale_res.ok()) return std::move(_scale_res).error();       \
        std::move(_scale_res).value();                                    \
    })

// SCALE_TRY_ASSIGN: MSVC-compatible alternative (no statement-expressions)
// Usage:  SCALE_TRY_ASSIGN(val, some_result_expr);
#define SCALE_TRY_ASSIGN(var, expr)                                       \
    auto _scale_tmp_##var = (expr);                                       \
    if (!_scale_tmp_##var.ok())                                           \
        return std::move(_scale_tmp_##var).error();                       \
    auto var = std::move(_scale_tmp_##var).value()

// SCALE_TRY_VOID: propagate errors from Result<void> expressions
#define SCALE_TRY_VOID(expr)                                              \
    do {                                                                  \
        auto _scale_tmp = (expr);                                         \
        if (!_scale_tmp.ok()) return std::move(_scale_tmp).error();       \
    } while (false)

} // namespace scale::core
