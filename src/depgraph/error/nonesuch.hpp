#pragma once

#include <optional>
#include <string>
#include <string_view>

namespace depgraph {

/**
 * @brief A name within a package manifest that refers to nothing, with the closest name that
 * does exist.
 */
struct e_nonesuch {
    /// The kind of entity that was named, such as "product" or "target"
    std::string_view           kind;
    std::string                given;
    std::optional<std::string> nearest;

    /// " (Did you mean '<nearest>'?)", or an empty string if there is no nearest name
    std::string suggestion() const;

    void log_error() const noexcept;
};

}  // namespace depgraph
