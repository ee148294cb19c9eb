#include "./io.hpp"

#include <depgraph/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <fstream>
#include <random>
#include <sstream>

using namespace depgraph;

namespace {

[[noreturn]] void throw_io_error(int err, std::string_view action, const std::filesystem::path& p) {
    auto ec = std::error_code{err, std::system_category()};
    auto msg = neo::ufmt("Failed to {} [{}]", action, p.string());
    BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec, msg), boost::leaf::e_errno{err}, ec);
}

}  // namespace

std::string depgraph::read_file(const std::filesystem::path& path) {
    DEPGRAPH_E_SCOPE(e_read_file_path{path});
    errno = 0;
    std::ifstream infile{path, std::ios::binary};
    if (!infile) {
        throw_io_error(errno, "open file", path);
    }
    std::ostringstream out;
    out << infile.rdbuf();
    if (infile.bad()) {
        throw_io_error(errno, "read from file", path);
    }
    return std::move(out).str();
}

void depgraph::write_file(const std::filesystem::path& path, std::string_view content) {
    DEPGRAPH_E_SCOPE(e_write_file_path{path});
    errno = 0;
    std::ofstream outfile{path, std::ios::binary | std::ios::trunc};
    if (!outfile) {
        throw_io_error(errno, "open file for writing", path);
    }
    outfile.write(content.data(), static_cast<std::streamsize>(content.size()));
    outfile.flush();
    if (!outfile) {
        throw_io_error(errno, "write to file", path);
    }
}

void depgraph::write_file_atomic(const std::filesystem::path& dest, std::string_view content) {
    DEPGRAPH_E_SCOPE(e_write_file_path{dest});
    thread_local std::mt19937 rng{std::random_device{}()};
    auto tmp = dest;
    tmp += neo::ufmt(".tmp-{:08x}", std::uniform_int_distribution<unsigned>{}(rng));
    try {
        write_file(tmp, content);
        sync_to_disk(tmp);
        std::filesystem::rename(tmp, dest);
    } catch (const std::exception&) {
        std::error_code ignore;
        std::filesystem::remove(tmp, ignore);
        throw;
    }
    sync_to_disk(dest.has_parent_path() ? dest.parent_path() : std::filesystem::path("."));
}
