#pragma once

#include <json5/data.hpp>

#include <string>
#include <string_view>

namespace depgraph {

/// The text of a document that failed to parse
struct e_json5_string {
    std::string value;
};

/// Describes why a document is not valid JSON5
struct e_json_parse_error {
    std::string value;
};

/**
 * @brief Parse a JSON5 document. Plain JSON is accepted, being a subset of JSON5.
 *
 * A document that is empty or only whitespace is rejected. Failures throw with an
 * e_json_parse_error and the offending e_json5_string.
 */
json5::data parse_json5_str(std::string_view content);

}  // namespace depgraph
