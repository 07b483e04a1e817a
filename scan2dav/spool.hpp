#pragma once

#include <boost/filesystem/path.hpp>

#include <cstdint>
#include <cstdio>
#include <memory>
#include <vector>

namespace scan2dav {

/// bounded temporary file holding one scan payload
///
/// The file is created below the spool directory and removed again when the
/// spool is destroyed, so a payload never outlives its relay job.
class spool
{
public:
    /// @throw std::system_error if the spool file can't be created
    spool(const boost::filesystem::path &dir, uintmax_t limit);
    ~spool();

    spool(const spool &) = delete;
    spool &operator=(const spool &) = delete;
    spool(spool &&) = delete;
    spool &operator=(spool &&) = delete;

    /// @return false if the data would exceed the limit, nothing is written then
    /// @throw std::system_error on write error
    bool append(const char *data, size_t length);

    /// flush all buffered data to the file
    void finish();

    /// position the file at its start and return it for reading
    FILE *rewind();

    /// read the whole content back, for tests and small payloads only
    std::vector<char> contents();

    uintmax_t size() const { return size_; }
    uintmax_t limit() const { return limit_; }
    const boost::filesystem::path &path() const { return path_; }

private:
    boost::filesystem::path path_;
    std::shared_ptr<FILE> file_guard_;
    uintmax_t size_{0};
    uintmax_t limit_;
};

} // namespace scan2dav
