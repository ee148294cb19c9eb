#pragma once

#include <algorithm>
#include <functional>
#include <initializer_list>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>

namespace depgraph {

std::size_t lev_edit_distance(std::string_view a, std::string_view b) noexcept;

/**
 * @brief Find the candidate whose name is closest to `given` by edit distance.
 *
 * `proj` maps each element of `candidates` to its name. Ties go to the earliest candidate.
 * Returns `nullopt` only if there are no candidates.
 */
template <std::ranges::forward_range Range, typename Proj = std::identity>
std::optional<std::string>
did_you_mean(std::string_view given, Range&& candidates, Proj proj = {}) noexcept {
    auto name_of  = [&](auto&& cand) { return std::string_view(std::invoke(proj, cand)); };
    auto distance = [&](auto&& cand) { return lev_edit_distance(name_of(cand), given); };
    auto best     = std::ranges::min_element(candidates, std::less{}, distance);
    if (best == std::ranges::end(candidates)) {
        return std::nullopt;
    }
    return std::string(name_of(*best));
}

inline std::optional<std::string>
did_you_mean(std::string_view given, std::initializer_list<std::string_view> strings) noexcept {
    return did_you_mean(given, std::views::all(strings));
}

}  // namespace depgraph
