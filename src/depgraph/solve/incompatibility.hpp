#pragma once

#include "./term.hpp"

#include <depgraph/util/wrap_var.hpp>

#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace depgraph {

/// Index of an incompatibility within an incompatibility_store
using incompatibility_id = std::size_t;

namespace cause {

/// The root package must be selected
struct root {};

/// A package version depends on a range of another package
struct dependency {
    /// If the depender is a package overridden by the root, a description of it
    std::optional<std::string> via = std::nullopt;
};

/// No available version of the package matches the given range
struct no_versions {};

/// The version provider knows of no versions of the package
struct package_not_found {};

/// The manifest of the package version could not be loaded
struct unavailable {
    std::string reason;
};

/// A package version depends on an unversioned requirement that the root does not provide
struct unversioned_dependency {
    package_identity dependency;
    std::string      requirement;
};

/// The incompatibility was derived from two others by the resolution rule
struct derived {
    incompatibility_id left;
    incompatibility_id right;
};

}  // namespace cause

class incompatibility_cause : public variant_wrapper<cause::root,
                                                     cause::dependency,
                                                     cause::no_versions,
                                                     cause::package_not_found,
                                                     cause::unavailable,
                                                     cause::unversioned_dependency,
                                                     cause::derived> {
public:
    using variant_wrapper::variant_wrapper;

    using variant_wrapper::as;
    using variant_wrapper::get_if;
    using variant_wrapper::is;
    using variant_wrapper::visit;

    bool is_derived() const noexcept { return is<cause::derived>(); }
};

/**
 * @brief A set of terms that may not all be true at once
 */
struct incompatibility {
    std::vector<term>     terms;
    incompatibility_cause cause;

    /// An incompatibility that proves that no solution exists
    bool is_failure(const package_identity& root) const noexcept;
};

/**
 * @brief Owns every incompatibility created during one solve, and indexes those that take part
 * in unit propagation by the packages they mention.
 *
 * Derived incompatibilities refer to their causes by id, forming a DAG within the store.
 */
class incompatibility_store {
    package_identity                                            _root;
    std::vector<incompatibility>                                _arena;
    std::map<package_identity, std::vector<incompatibility_id>> _by_package;

public:
    explicit incompatibility_store(package_identity root) noexcept
        : _root(std::move(root)) {}

    /**
     * @brief Create a new incompatibility in the store, without making it visible to
     * for_package().
     *
     * Terms referring to the same package are merged. Derived incompatibilities omit a positive
     * term for the root package, which always holds.
     */
    incompatibility_id create(std::vector<term> terms, incompatibility_cause cause);

    /// Make the given incompatibility visible to for_package()
    void attach(incompatibility_id id);

    /// Shorthand for create() followed by attach()
    incompatibility_id add(std::vector<term> terms, incompatibility_cause cause) {
        auto id = create(std::move(terms), std::move(cause));
        attach(id);
        return id;
    }

    const incompatibility& operator[](incompatibility_id id) const noexcept;

    /// The attached incompatibilities that mention the given package, in order of attachment
    std::vector<incompatibility_id> for_package(const package_identity&) const noexcept;

    const package_identity& root() const noexcept { return _root; }
    std::size_t             size() const noexcept { return _arena.size(); }
};

}  // namespace depgraph
