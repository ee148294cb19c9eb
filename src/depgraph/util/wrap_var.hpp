#pragma once

#include <neo/fwd.hpp>

#include <concepts>
#include <cstddef>
#include <variant>

namespace depgraph {

/**
 * @brief Combine several callables into one overloaded callable, for use with visit()
 */
template <typename... Fs>
struct overloaded : Fs... {
    using Fs::operator()...;
};

template <typename... Fs>
overloaded(Fs...) -> overloaded<Fs...>;

/**
 * @brief Base class for a closed set of error or value alternatives.
 *
 * Derived types inherit the constructors and expose a domain-specific interface on top of the
 * underlying variant. `visit()` accepts any number of callables, which are combined with
 * `overloaded`.
 *
 * @tparam Ts The alternatives held by the wrapper
 */
template <typename... Ts>
class variant_wrapper {
    using variant_type = std::variant<Ts...>;

    variant_type _var;

public:
    // clang-format off
    template <typename Arg>
        requires std::constructible_from<variant_type, Arg&&>
    explicit(!std::convertible_to<Arg&&, variant_type>)
    constexpr variant_wrapper(Arg&& arg)
        noexcept(std::is_nothrow_constructible_v<variant_type, Arg&&>)
        : _var(NEO_FWD(arg)) {}
    // clang-format on

    variant_wrapper(const variant_wrapper&) = default;
    variant_wrapper(variant_wrapper&&)      = default;

    variant_wrapper& operator=(const variant_wrapper&) = default;
    variant_wrapper& operator=(variant_wrapper&&) = default;

    /// Index of the active alternative, in declaration order
    constexpr std::size_t index() const noexcept { return _var.index(); }

protected:
    template <typename... Fs>
    constexpr decltype(auto) visit(Fs&&... fns) const {
        return std::visit(overloaded{NEO_FWD(fns)...}, _var);
    }

    template <typename... Fs>
    constexpr decltype(auto) visit(Fs&&... fns) {
        return std::visit(overloaded{NEO_FWD(fns)...}, _var);
    }

    template <typename T>
    constexpr bool is() const noexcept requires(std::same_as<T, Ts> || ...) {
        return std::holds_alternative<T>(_var);
    }

    template <typename T>
    constexpr T& as() & noexcept {
        return *std::get_if<T>(&_var);
    }

    template <typename T>
    constexpr const T& as() const& noexcept {
        return *std::get_if<T>(&_var);
    }

    template <typename T>
    constexpr const T* get_if() const noexcept {
        return std::get_if<T>(&_var);
    }
};

}  // namespace depgraph
