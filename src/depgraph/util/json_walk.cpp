#include "./json_walk.hpp"

#include <depgraph/pkg/identity.hpp>

#include <semver/version.hpp>

using namespace depgraph;

package_identity walk_utils::identity_from_string::operator()(std::string s) const {
    return package_identity::from_string(s);
}

semver::version walk_utils::version_from_string::operator()(std::string s) const {
    return semver::version::parse(s);
}
