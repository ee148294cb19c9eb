#pragma once

#include <neo/pp.hpp>

#include <boost/leaf/on_error.hpp>

/// Wrap an expression in a lambda, so that it is only evaluated if an error occurs
#define DEPGRAPH_E_ARG(...) ([&] { return __VA_ARGS__; })

/**
 * @brief Attach an error object to any error that leaves the enclosing scope.
 *
 * The expression is evaluated lazily. Used to tag failures with the file or package that was
 * being processed, e.g. `DEPGRAPH_E_SCOPE(e_read_file_path{fpath});`
 */
#define DEPGRAPH_E_SCOPE(...)                                                                      \
    auto NEO_CONCAT(_depgraph_err_info_, __LINE__)                                                 \
        = boost::leaf::on_error(DEPGRAPH_E_ARG(__VA_ARGS__))
