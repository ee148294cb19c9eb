#include "./io.hpp"

#include <depgraph/error/on_error.hpp>

#include <boost/leaf/common.hpp>
#include <boost/leaf/exception.hpp>
#include <neo/ufmt.hpp>

#include <fcntl.h>
#include <unistd.h>

#include <cerrno>
#include <system_error>

void depgraph::sync_to_disk(const std::filesystem::path& path) {
    DEPGRAPH_E_SCOPE(e_write_file_path{path});
    const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
    if (fd < 0) {
        const int err = errno;
        auto      ec  = std::error_code{err, std::system_category()};
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to open [{}] for syncing",
                                                               path.string())),
                                   boost::leaf::e_errno{err},
                                   ec);
    }
    const int rc  = ::fsync(fd);
    const int err = errno;
    ::close(fd);
    if (rc != 0) {
        auto ec = std::error_code{err, std::system_category()};
        BOOST_LEAF_THROW_EXCEPTION(std::system_error(ec,
                                                     neo::ufmt("Failed to sync [{}] to disk",
                                                               path.string())),
                                   boost::leaf::e_errno{err},
                                   ec);
    }
}
