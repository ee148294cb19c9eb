#include "./parse.hpp"

#include <depgraph/error/on_error.hpp>

#include <boost/leaf/exception.hpp>
#include <json5/parse_data.hpp>

#include <algorithm>
#include <cctype>

using namespace depgraph;

json5::data depgraph::parse_json5_str(std::string_view content) {
    DEPGRAPH_E_SCOPE(e_json5_string{std::string(content)});
    const bool blank = std::ranges::all_of(content, [](unsigned char c) {
        return std::isspace(c) != 0;
    });
    if (blank) {
        BOOST_LEAF_THROW_EXCEPTION(e_json_parse_error{"The document is empty"});
    }
    try {
        return json5::parse_data(content);
    } catch (const json5::parse_error& err) {
        BOOST_LEAF_THROW_EXCEPTION(err, e_json_parse_error{err.what()});
    }
}
