#pragma once

#include <boost/leaf.hpp>

#include <exception>
#include <tuple>
#include <type_traits>
#include <utility>

namespace depgraph {

template <typename H>
struct leaf_catch_block {
    H handler;
};

/**
 * @brief Accumulates a try-block and its handlers. Evaluated once it is added to a
 * leaf_run_try_catch.
 */
template <typename Try, typename... Handlers>
class leaf_try_sequence {
    Try&                    _try_block;
    std::tuple<Handlers...> _handlers;

public:
    constexpr leaf_try_sequence(Try& t, std::tuple<Handlers...> hs)
        : _try_block(t)
        , _handlers(std::move(hs)) {}

    template <typename H>
    constexpr auto operator*(leaf_catch_block<H> c) && {
        return leaf_try_sequence<Try, Handlers..., H>{
            _try_block,
            std::tuple_cat(std::move(_handlers), std::make_tuple(std::move(c.handler)))};
    }

    decltype(auto) run() && {
        static_assert(sizeof...(Handlers) != 0,
                      "depgraph_leaf_try requires one or more depgraph_leaf_catch blocks");
        using result_type = std::invoke_result_t<Try&>;
        return std::apply(
            [&](auto&... hs) -> decltype(auto) {
                if constexpr (boost::leaf::is_result_type<result_type>::value) {
                    return boost::leaf::try_handle_all(_try_block, hs...);
                } else {
                    return boost::leaf::try_catch(_try_block, hs...);
                }
            },
            _handlers);
    }
};

struct leaf_make_try_block {
    template <typename Func>
    constexpr auto operator->*(Func&& block) const {
        return leaf_try_sequence<std::remove_reference_t<Func>>{block, {}};
    }
};

struct leaf_make_catch_block {
    template <typename Func>
    constexpr auto operator->*(Func&& block) const {
        return leaf_catch_block<std::remove_cvref_t<Func>>{std::forward<Func>(block)};
    }
};

struct leaf_run_try_catch {
    template <typename Try, typename... Handlers>
    constexpr decltype(auto) operator+(leaf_try_sequence<Try, Handlers...>&& seq) const {
        return std::move(seq).run();
    }
};

using boost::leaf::catch_;
using boost::leaf::current_error;

/**
 * @brief Return type for handlers that never return normally (they always rethrow)
 */
struct noreturn_t {
    template <typename T>
    constexpr operator T() const noexcept {
        std::terminate();
    }
};

}  // namespace depgraph

/**
 * @brief Create a try {} block that handles all errors using Boost.LEAF
 */
#define depgraph_leaf_try                                                                          \
    ::depgraph::leaf_run_try_catch{} + ::depgraph::leaf_make_try_block{}->*[&]()

/**
 * @brief Create an error handling block for Boost.LEAF
 */
#define depgraph_leaf_catch *::depgraph::leaf_make_catch_block{}->*[&]

#define depgraph_leaf_catch_all                                                                    \
    depgraph_leaf_catch(::boost::leaf::verbose_diagnostic_info const& diagnostic_info            \
                        [[maybe_unused]])
