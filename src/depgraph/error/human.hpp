#pragma once

#include <string>

namespace depgraph {

/**
 * @brief A message intended to be shown to a user verbatim
 */
struct e_human_message {
    std::string value;
};

}  // namespace depgraph
