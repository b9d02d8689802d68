#ifndef PSHARE_STORAGE_OPENFILE_HPP_
#define PSHARE_STORAGE_OPENFILE_HPP_

#include <cstddef>
#include <cstdint>
#include <string>

#include <boost/interprocess/file_mapping.hpp>
#include <boost/interprocess/mapped_region.hpp>

namespace pshare::storage
{
// Read-only memory mapping of a whole file, released when the object goes out of scope
class OpenFile
{
public:
    explicit OpenFile(std::string file_path);

    OpenFile(const OpenFile &) = delete;
    OpenFile &operator=(const OpenFile &) = delete;

    [[nodiscard]] explicit    operator bool() const;
    [[nodiscard]] bool        is_valid() const;
    [[nodiscard]] size_t      size() const;
    [[nodiscard]] std::string file_path() const;

    // Copies up to amount bytes starting at offset; returns the number of bytes copied
    size_t read(size_t offset, size_t amount, uint8_t *out) const;

private:
    std::string                        file_path_;
    boost::interprocess::file_mapping  mapping_;
    boost::interprocess::mapped_region mapped_region_;
    bool                               is_valid_;
};
}  // namespace pshare::storage

#endif  // PSHARE_STORAGE_OPENFILE_HPP_
