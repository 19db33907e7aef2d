/**
 * @file validated.h
 * @brief Valid-or-accumulated-errors sum type and its combinators
 *
 * A Validated<E, T> is either Valid(T) or Invalid(NonEmptyList<E>).
 * Combining several Validated values with zipOrAccumulate never stops at the
 * first failure: every part is inspected and all errors are concatenated in
 * argument order.
 */

#pragma once

#include "person/validation/non_empty_list.h"

#include <optional>
#include <ostream>
#include <stdexcept>
#include <type_traits>
#include <utility>
#include <variant>

namespace person::validation {

template<typename E, typename T>
class Validated {
private:
    static constexpr std::size_t kValid = 0;
    static constexpr std::size_t kInvalid = 1;

    std::variant<T, NonEmptyList<E>> state_;

    template<std::size_t I, typename V>
    Validated(std::in_place_index_t<I> tag, V&& payload)
        : state_(tag, std::forward<V>(payload)) {}

public:
    using error_type = E;
    using value_type = T;

    static Validated valid(T value) {
        return Validated(std::in_place_index<kValid>, std::move(value));
    }

    static Validated invalid(NonEmptyList<E> errors) {
        return Validated(std::in_place_index<kInvalid>, std::move(errors));
    }

    static Validated invalid(E error) {
        return invalid(NonEmptyList<E>(std::move(error)));
    }

    [[nodiscard]] bool isValid() const noexcept { return state_.index() == kValid; }
    [[nodiscard]] bool isInvalid() const noexcept { return state_.index() == kInvalid; }

    /**
     * @brief Validated value
     * @throws std::logic_error if this is Invalid
     */
    [[nodiscard]] const T& value() const {
        if (!isValid()) {
            throw std::logic_error("Validated::value() called on an Invalid result");
        }
        return std::get<kValid>(state_);
    }

    /**
     * @brief Accumulated errors
     * @throws std::logic_error if this is Valid
     */
    [[nodiscard]] const NonEmptyList<E>& errors() const {
        if (!isInvalid()) {
            throw std::logic_error("Validated::errors() called on a Valid result");
        }
        return std::get<kInvalid>(state_);
    }

    /**
     * @brief Transform the valid value, keeping errors untouched
     */
    template<typename F>
    auto map(F&& f) const -> Validated<E, std::invoke_result_t<F, const T&>> {
        using R = std::invoke_result_t<F, const T&>;
        if (isValid()) {
            return Validated<E, R>::valid(std::forward<F>(f)(value()));
        }
        return Validated<E, R>::invalid(errors());
    }

    /**
     * @brief Collapse both branches into a single value
     */
    template<typename OnInvalid, typename OnValid>
    auto fold(OnInvalid&& onInvalid, OnValid&& onValid) const
        -> std::invoke_result_t<OnValid, const T&> {
        if (isValid()) {
            return std::forward<OnValid>(onValid)(value());
        }
        return std::forward<OnInvalid>(onInvalid)(errors());
    }

    bool operator==(const Validated& other) const { return state_ == other.state_; }
    bool operator!=(const Validated& other) const { return !(*this == other); }
};

template<typename E, typename T>
std::ostream& operator<<(std::ostream& os, const Validated<E, T>& v) {
    if (v.isValid()) {
        return os << "Valid(" << v.value() << ")";
    }
    return os << "Invalid(" << v.errors() << ")";
}

/**
 * @brief Valid(value) when condition holds, Invalid([error]) otherwise
 */
template<typename E, typename T>
Validated<E, T> check(bool condition, E error, T value) {
    if (condition) {
        return Validated<E, T>::valid(std::move(value));
    }
    return Validated<E, T>::invalid(std::move(error));
}

/**
 * @brief Combine independent validations, accumulating every failure
 *
 * All parts are inspected. Errors are concatenated in argument order.
 * combine is invoked with every part's value only when no part failed.
 */
template<typename E, typename F, typename... Ts>
auto zipOrAccumulate(F&& combine, const Validated<E, Ts>&... parts)
    -> Validated<E, std::invoke_result_t<F, const Ts&...>> {
    using R = std::invoke_result_t<F, const Ts&...>;

    std::optional<NonEmptyList<E>> errors;
    auto collect = [&errors](const auto& part) {
        if (part.isValid()) return;
        if (errors) {
            errors->append(part.errors());
        } else {
            errors.emplace(part.errors());
        }
    };
    (collect(parts), ...);

    if (errors) {
        return Validated<E, R>::invalid(std::move(*errors));
    }
    return Validated<E, R>::valid(std::forward<F>(combine)(parts.value()...));
}

} // namespace person::validation
