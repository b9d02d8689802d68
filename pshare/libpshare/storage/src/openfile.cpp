#include "openfile.hpp"

#include <algorithm>

#include <glog/logging.h>

namespace pshare::storage
{
OpenFile::OpenFile(std::string file_path)
    : file_path_ {std::move(file_path)}
    , is_valid_ {false}
{
    try
    {
        mapping_ = boost::interprocess::file_mapping {
            file_path_.c_str(), boost::interprocess::read_only};
        mapped_region_ =
            boost::interprocess::mapped_region {mapping_, boost::interprocess::read_only};
    }
    catch (const boost::interprocess::interprocess_exception &e)
    {
        LOG(ERROR) << "Cannot map " << file_path_ << " for reading: " << e.what();
        return;
    }

    is_valid_ = true;
}

OpenFile::operator bool() const
{
    return is_valid_;
}

bool OpenFile::is_valid() const
{
    return is_valid_;
}

size_t OpenFile::size() const
{
    return is_valid_ ? mapped_region_.get_size() : 0;
}

std::string OpenFile::file_path() const
{
    return file_path_;
}

size_t OpenFile::read(size_t offset, size_t amount, uint8_t *out) const
{
    if (!is_valid_)
    {
        LOG(ERROR) << "File " << file_path_ << " is not mapped";
        return 0;
    }

    if (offset >= size())
    {
        LOG(ERROR) << "Read offset " << offset << " past the end of " << file_path_
                   << " (size = " << size() << ")";
        return 0;
    }

    size_t bytes_to_read = std::min(amount, size() - offset);
    std::copy_n(static_cast<const uint8_t *>(mapped_region_.get_address()) + offset,
        bytes_to_read, out);
    return bytes_to_read;
}
}  // namespace pshare::storage
