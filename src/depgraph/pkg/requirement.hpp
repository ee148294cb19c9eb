#pragma once

#include "./identity.hpp"
#include "./version_range.hpp"

#include <depgraph/util/wrap_var.hpp>

#include <filesystem>
#include <string>
#include <string_view>

namespace depgraph {

enum class requirement_kind {
    version,
    branch,
    revision,
    path,
};

/// Track the tip of a named branch
struct branch_requirement {
    std::string name;

    bool operator==(const branch_requirement&) const noexcept = default;
};

/// Use a fixed revision (commit) of the repository
struct revision_requirement {
    std::string id;

    bool operator==(const revision_requirement&) const noexcept = default;
};

/// Use the package found at a local directory. Never version-resolved.
struct path_requirement {
    std::filesystem::path path;

    bool operator==(const path_requirement&) const noexcept = default;
};

/**
 * @brief A constraint on which versions of a package are acceptable.
 *
 * Only version-range requirements take part in version solving. The other kinds name a single
 * source for the package, and are only honored when declared by the root package.
 */
class requirement : public variant_wrapper<version_range_set,
                                           branch_requirement,
                                           revision_requirement,
                                           path_requirement> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    requirement_kind kind() const noexcept;
    bool             is_versioned() const noexcept { return is<version_range_set>(); }

    std::string to_string() const noexcept;

    friend bool operator==(const requirement& lhs, const requirement& rhs) noexcept;
};

bool operator==(const requirement& lhs, const requirement& rhs) noexcept;

struct e_parse_dependency_string {
    std::string value;
};

/**
 * @brief A package declared as a dependency, with the requirement placed upon it
 */
struct dependency {
    package_identity      identity;
    depgraph::requirement requirement;

    /**
     * @brief Parse a dependency from its shorthand text form.
     *
     * Supported forms:
     *
     * - `name@1.2.3` or `name^1.2.3`: At least 1.2.3, up to the next major version
     * - `name~1.2.3`: At least 1.2.3, up to the next minor version
     * - `name=1.2.3`: Exactly 1.2.3
     * - `name+1.2.3`: 1.2.3 or any later version
     * - `name@[1.0.0,2.0.0)`: An explicit interval. Either bracket style may be used.
     * - `name branch=main`, `name revision=<id>`, `name path=<dir>`
     */
    [[nodiscard]] static dependency parse_shorthand(std::string_view);

    std::string to_string() const noexcept;
};

}  // namespace depgraph
