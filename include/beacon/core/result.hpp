#pragma once
#include <cstddef>
#include <optional>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>
namespace beacon::node {

/// Value of a Result that carries no payload.
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};
inline constexpr Unit unit{};

/**
 * @brief Either a value of type T or an error of type E.
 *
 * Every fallible operation of the library returns one of these; nothing
 * below the process entry point reports recoverable failures by throwing.
 * Unwrap/UnwrapErr on the wrong alternative throw std::logic_error, which
 * is a programming error and never caught by library code.
 *
 * The rvalue accessors (`std::move(result).Unwrap()`) return by value so a
 * temporary Result can be unwrapped without leaving a dangling reference.
 */
template<typename T, typename E>
class Result {
    static constexpr std::size_t OK_INDEX = 0;
    static constexpr std::size_t ERR_INDEX = 1;
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<OK_INDEX>, std::move(value));
    }
    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<ERR_INDEX>, std::move(error));
    }
    /// Ok with the contained value, otherwise Err(@p error_if_none).
    [[nodiscard]] static Result FromOptional(std::optional<T> value, E error_if_none) {
        return value.has_value() ? Ok(std::move(*value)) : Err(std::move(error_if_none));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == OK_INDEX; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == ERR_INDEX; }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }
    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<OK_INDEX>(storage_);
    }
    [[nodiscard]] T Unwrap() && {
        RequireOk();
        return std::get<OK_INDEX>(std::move(storage_));
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<ERR_INDEX>(storage_);
    }
    [[nodiscard]] E UnwrapErr() && {
        RequireErr();
        return std::get<ERR_INDEX>(std::move(storage_));
    }

    [[nodiscard]] T UnwrapOr(T fallback) && {
        return IsOk() ? std::get<OK_INDEX>(std::move(storage_)) : std::move(fallback);
    }

    /// Drops the error, keeping only the value.
    [[nodiscard]] std::optional<T> Ok() && {
        if (IsErr()) {
            return std::nullopt;
        }
        return std::optional<T>(std::get<OK_INDEX>(std::move(storage_)));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<OK_INDEX>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<ERR_INDEX>(std::move(storage_))));
    }

    /// Chains a step that can itself fail with the same error type.
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind step must fail with the same error type");
        if (IsErr()) {
            return Next::Err(std::get<ERR_INDEX>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<OK_INDEX>(std::move(storage_)));
    }

private:
    template<std::size_t Index, typename Arg>
    Result(std::in_place_index_t<Index> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::logic_error("Unwrap() called on an Err result");
        }
    }
    void RequireErr() const {
        if (IsOk()) {
            throw std::logic_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> storage_;
};

}
