#pragma once

#include <boost/leaf/exception.hpp>
#include <magic_enum.hpp>

#include <string>
#include <string_view>

namespace depgraph {

template <typename E>
struct e_invalid_enum {
    std::string value;
};

struct e_invalid_enum_str {
    std::string value;
};

/// A comma-separated list of the accepted spellings, each in quotes
struct e_enum_options {
    std::string value;
};

/**
 * @brief Convert the name of an enumerator to its value. Throws e_invalid_enum_str (with the
 * list of accepted names) if no enumerator has the given name.
 */
template <typename E>
constexpr auto parse_enum_str = [](std::string_view sv) {
    auto e = magic_enum::enum_cast<E>(sv);
    if (e.has_value()) {
        return *e;
    }

    BOOST_LEAF_THROW_EXCEPTION(  //
        e_invalid_enum<E>{std::string(magic_enum::enum_type_name<E>())},
        e_invalid_enum_str{std::string(sv)},
        [&] {
            std::string acc;
            for (auto name : magic_enum::enum_names<E>()) {
                if (!acc.empty()) {
                    acc += ", ";
                }
                acc += "\"";
                acc += name;
                acc += "\"";
            }
            return e_enum_options{acc};
        });
};

/// The spelling of an enumerator, as accepted by parse_enum_str
template <typename E>
std::string_view enum_str(E e) noexcept {
    return magic_enum::enum_name(e);
}

}  // namespace depgraph
