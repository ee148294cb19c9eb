#pragma once

#include <fmt/core.h>

#include <compare>
#include <iosfwd>
#include <string>
#include <string_view>

namespace depgraph {

struct e_invalid_identity {
    std::string value;
};

/**
 * @brief The canonical key of a package.
 *
 * Identities are derived from either a plain package name or a repository URL. They are trimmed
 * and lower-cased, and for URLs (or filesystem paths) only the final path component is kept, with
 * any trailing ".git" removed. Thus "https://github.com/Org/Foo.git", "FOO", and "foo" are all
 * the same package.
 */
class package_identity {
    std::string _str;

    explicit package_identity(std::string s) noexcept
        : _str(std::move(s)) {}

public:
    /**
     * @brief Canonicalize a name or URL. Throws e_invalid_identity if the canonical form is not
     * a valid identity.
     */
    [[nodiscard]] static package_identity from_string(std::string_view);

    const std::string& str() const noexcept { return _str; }

    auto operator<=>(const package_identity&) const noexcept = default;
    bool operator==(const package_identity&) const noexcept = default;

    friend std::ostream& operator<<(std::ostream& out, const package_identity& self);
};

/**
 * @brief Obtain the canonical spelling of the given name or URL, without validating it.
 */
std::string canonicalize_identity_string(std::string_view) noexcept;

}  // namespace depgraph

template <>
struct fmt::formatter<depgraph::package_identity> : fmt::formatter<std::string_view> {
    template <typename FormatContext>
    auto format(const depgraph::package_identity& id, FormatContext& ctx) const {
        return fmt::formatter<std::string_view>::format(id.str(), ctx);
    }
};
