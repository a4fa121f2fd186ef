#pragma once
#include <cstddef>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace swarmauth::protocol {

/// Value type for results that carry no payload
struct Unit {
    constexpr bool operator==(const Unit&) const noexcept = default;
};

inline constexpr Unit unit{};

/**
 * Success value or failure, never both. Failures travel as values; the
 * only throwing paths are Unwrap on an Err and UnwrapErr on an Ok, which
 * are programming errors.
 *
 * @code
 * auto keys = KeyMaterial::Generate(seed);
 * if (keys.IsErr()) {
 *     return Result<Foo, AuthFailure>::Err(keys.UnwrapErr());
 * }
 * auto pair = std::move(keys).Unwrap();
 * @endcode
 */
template<typename T, typename E>
class Result {
public:
    using value_type = T;
    using error_type = E;

    [[nodiscard]] static Result Ok(T value) {
        return Result(std::in_place_index<kOkIndex>, std::move(value));
    }

    [[nodiscard]] static Result Err(E error) {
        return Result(std::in_place_index<kErrIndex>, std::move(error));
    }

    [[nodiscard]] bool IsOk() const noexcept { return storage_.index() == kOkIndex; }
    [[nodiscard]] bool IsErr() const noexcept { return storage_.index() == kErrIndex; }

    template<typename Pred>
    [[nodiscard]] bool IsErrAnd(Pred&& pred) const {
        if (!IsErr()) {
            return false;
        }
        return std::forward<Pred>(pred)(std::get<kErrIndex>(storage_));
    }

    [[nodiscard]] T& Unwrap() & {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }

    [[nodiscard]] const T& Unwrap() const& {
        RequireOk();
        return std::get<kOkIndex>(storage_);
    }

    /// Moves the value out; safe on temporaries
    [[nodiscard]] T Unwrap() && {
        RequireOk();
        return std::get<kOkIndex>(std::move(storage_));
    }

    [[nodiscard]] E& UnwrapErr() & {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }

    [[nodiscard]] const E& UnwrapErr() const& {
        RequireErr();
        return std::get<kErrIndex>(storage_);
    }

    [[nodiscard]] E UnwrapErr() && {
        RequireErr();
        return std::get<kErrIndex>(std::move(storage_));
    }

    template<typename F>
    [[nodiscard]] auto Map(F&& func) && -> Result<std::invoke_result_t<F, T>, E> {
        using Mapped = Result<std::invoke_result_t<F, T>, E>;
        if (IsErr()) {
            return Mapped::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return Mapped::Ok(std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_))));
    }

    template<typename F>
    [[nodiscard]] auto MapErr(F&& func) && -> Result<T, std::invoke_result_t<F, E>> {
        using Mapped = Result<T, std::invoke_result_t<F, E>>;
        if (IsOk()) {
            return Mapped::Ok(std::get<kOkIndex>(std::move(storage_)));
        }
        return Mapped::Err(std::forward<F>(func)(std::get<kErrIndex>(std::move(storage_))));
    }

    /// func receives the value and returns a Result with the same error type
    template<typename F>
    [[nodiscard]] auto Bind(F&& func) && -> std::invoke_result_t<F, T> {
        using Next = std::invoke_result_t<F, T>;
        static_assert(std::is_same_v<typename Next::error_type, E>,
                      "Bind continuation must keep the error type");
        if (IsErr()) {
            return Next::Err(std::get<kErrIndex>(std::move(storage_)));
        }
        return std::forward<F>(func)(std::get<kOkIndex>(std::move(storage_)));
    }

private:
    static constexpr std::size_t kOkIndex = 0;
    static constexpr std::size_t kErrIndex = 1;

    template<std::size_t I, typename Arg>
    Result(std::in_place_index_t<I> index, Arg&& arg)
        : storage_(index, std::forward<Arg>(arg)) {}

    void RequireOk() const {
        if (IsErr()) {
            throw std::runtime_error("Unwrap() called on an Err result");
        }
    }

    void RequireErr() const {
        if (IsOk()) {
            throw std::runtime_error("UnwrapErr() called on an Ok result");
        }
    }

    std::variant<T, E> storage_;
};

}
