/*
 * Bounded spool file for a single inbound scan.
 *
 * The payload is written to "<spooldir>/scan-XXXX.upload" while it arrives and
 * read back by the relay.  Nothing is kept once the spool is destroyed.
 */
#include "scan2dav/spool.hpp"

#include <boost/current_function.hpp>
#include <boost/filesystem/operations.hpp>

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <sys/stat.h>
#include <sys/types.h>
#include <syslog.h>
#include <system_error>
#include <unistd.h>

namespace scan2dav {

spool::spool(const boost::filesystem::path &dir, uintmax_t limit) : limit_(limit)
{
    path_ = dir / boost::filesystem::unique_path("scan-%%%%-%%%%-%%%%-%%%%.upload");

    int fd = open(path_.c_str(), O_RDWR | O_CREAT | O_EXCL, 0600);
    if (fd < 0) {
        int error = errno;
        syslog(LOG_ERR, "scan2dav: can't create spool file %s: %s\n", path_.c_str(), strerror(error));
        throw std::system_error(error, std::generic_category(), "spool");
    }

    FILE *file = fdopen(fd, "w+b");
    if (file == nullptr) {
        int error = errno;
        (void)close(fd);
        (void)unlink(path_.c_str());
        throw std::system_error(error, std::generic_category(), "spool");
    }

    file_guard_ = std::shared_ptr<FILE>(file, std::fclose);
    syslog(LOG_DEBUG, "%s: %s\n", BOOST_CURRENT_FUNCTION, path_.c_str());
}

spool::~spool()
{
    file_guard_.reset();

    boost::system::error_code ec;
    (void)boost::filesystem::remove(path_, ec);
    if (ec) {
        syslog(LOG_WARNING, "scan2dav: can't remove spool file %s: %s\n", path_.c_str(), ec.message().c_str());
    }
}

bool spool::append(const char *data, size_t length)
{
    if (length > limit_ - size_) {
        syslog(LOG_WARNING, "scan2dav: spool limit of %ju bytes exceeded\n", limit_);
        return false;
    }

    if (length != 0 && std::fwrite(data, 1, length, file_guard_.get()) != length) {
        int error = errno;
        syslog(LOG_ERR, "scan2dav: write to %s failed: %s\n", path_.c_str(), strerror(error));
        throw std::system_error(error, std::generic_category(), "spool write");
    }

    size_ += length;
    return true;
}

void spool::finish()
{
    if (std::fflush(file_guard_.get()) != 0) {
        int error = errno;
        syslog(LOG_ERR, "scan2dav: flush of %s failed: %s\n", path_.c_str(), strerror(error));
        throw std::system_error(error, std::generic_category(), "spool flush");
    }
}

FILE *spool::rewind()
{
    finish();
    if (std::fseek(file_guard_.get(), 0, SEEK_SET) != 0) {
        throw std::system_error(errno, std::generic_category(), "spool rewind");
    }
    return file_guard_.get();
}

std::vector<char> spool::contents()
{
    std::vector<char> data(size_);
    FILE *file = rewind();
    if (!data.empty() && std::fread(data.data(), 1, data.size(), file) != data.size()) {
        throw std::system_error(EIO, std::generic_category(), "spool read");
    }
    return data;
}

} // namespace scan2dav
