#pragma once

#include "./incompatibility.hpp"

#include <string>

namespace depgraph {

/**
 * @brief Describe the fact stated by a single incompatibility, as an English clause.
 */
std::string describe_incompatibility(const incompatibility_store&, incompatibility_id);

/**
 * @brief Render the derivation of the given incompatibility as a chain of "Because ... then ..."
 * steps, beginning with the earliest derivations.
 */
std::string explain_derivation(const incompatibility_store&, incompatibility_id);

}  // namespace depgraph
