#include <depgraph/dym.hpp>

#include <range/v3/algorithm/min.hpp>
#include <range/v3/range/conversion.hpp>
#include <range/v3/view/enumerate.hpp>
#include <range/v3/view/iota.hpp>

#include <utility>
#include <vector>

using namespace depgraph;

std::size_t depgraph::lev_edit_distance(std::string_view a, std::string_view b) noexcept {
    if (a.size() < b.size()) {
        std::swap(a, b);
    }
    // Two rows of the edit matrix, indexed by position in the shorter string
    auto prev = ranges::views::iota(std::size_t(0), b.size() + 1) | ranges::to<std::vector>();
    std::vector<std::size_t> cur(prev.size());

    for (auto [row, a_char] : a | ranges::views::enumerate) {
        cur[0] = row + 1;
        for (auto [col, b_char] : b | ranges::views::enumerate) {
            const std::size_t subst = prev[col] + (a_char == b_char ? 0 : 1);
            cur[col + 1]            = ranges::min({prev[col + 1] + 1, cur[col] + 1, subst});
        }
        std::swap(prev, cur);
    }
    return prev.back();
}
