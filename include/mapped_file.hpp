#ifndef SDS_MAPPED_FILE_HPP
#define SDS_MAPPED_FILE_HPP

#include "common.hpp"
#include <cerrno>
#include <string>
#include <system_error>
#include <utility>

#include <fcntl.h>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace sds {

/// \brief Read-only memory mapping of a whole file. Structures viewed with viewSerialized() must not outlive the
/// mapping, and the file must not be modified while it is mapped.
class MappedFile {
    Byte* mem = nullptr;
    Index numBytes = 0;

    [[noreturn]] static void throwSystemError(int fd, const std::string& what) {
        const int err = errno;
        if (fd >= 0) {
            ::close(fd);
        }
        throw std::system_error(err, std::generic_category(), what);
    }

public:
    MappedFile() noexcept = default;

    /// \throw std::system_error if the file can't be opened or mapped
    explicit MappedFile(const std::string& path) {
        const int fd = ::open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd < 0) {
            throwSystemError(fd, "can't open '" + path + "'");
        }
        struct stat info {};
        if (::fstat(fd, &info) != 0) {
            throwSystemError(fd, "can't stat '" + path + "'");
        }
        numBytes = Index(info.st_size);
        // mapping 0 bytes is an error, an empty file simply has no memory
        if (numBytes > 0) {
            void* ptr = ::mmap(nullptr, std::size_t(numBytes), PROT_READ, MAP_PRIVATE, fd, 0);
            if (ptr == MAP_FAILED) {
                throwSystemError(fd, "can't map '" + path + "'");
            }
            mem = static_cast<Byte*>(ptr);
        }
        ::close(fd);
    }

    MappedFile(MappedFile&& other) noexcept
        : mem(std::exchange(other.mem, nullptr)), numBytes(std::exchange(other.numBytes, 0)) {}

    MappedFile& operator=(MappedFile&& other) noexcept {
        using std::swap;
        swap(mem, other.mem);
        swap(numBytes, other.numBytes);
        return *this;
    }

    ~MappedFile() noexcept {
        if (mem) {
            ::munmap(mem, std::size_t(numBytes));
        }
    }

    [[nodiscard]] Index size() const noexcept { return numBytes; }

    /// \brief The mapped bytes, aligned to a page boundary.
    [[nodiscard]] Span<const Byte> bytes() const noexcept { return {mem, numBytes}; }
};

} // namespace sds

#endif // SDS_MAPPED_FILE_HPP
