#pragma once

#include "kiln/utility.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <filesystem>
#include <format>
#include <memory>
#include <string_view>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kiln {

// Read-only mapping of a whole file. Empty files map to an empty view.
class MappedFile {
    struct Private {
        explicit Private() = default;
    };

public:
    static Result<std::shared_ptr<MappedFile>> map(const std::filesystem::path &path) {
        int fd = open(path.c_str(), O_RDONLY | O_CLOEXEC);
        if (fd == -1) {
            return fail(ErrorKind::Io, std::format("Failed to open {}: {}", path.string(), std::strerror(errno)));
        }

        struct stat sb;
        if (fstat(fd, &sb) == -1) {
            int saved = errno;
            close(fd);
            return fail(ErrorKind::Io, std::format("Failed to stat {}: {}", path.string(), std::strerror(saved)));
        }
        if (!S_ISREG(sb.st_mode)) {
            close(fd);
            return fail(ErrorKind::Io, std::format("Not a regular file: {}", path.string()));
        }

        auto size = static_cast<size_t>(sb.st_size);
        char *data = nullptr;
        if (size != 0) {
            void *addr = mmap(nullptr, size, PROT_READ, MAP_PRIVATE, fd, 0);
            if (addr == MAP_FAILED) {
                int saved = errno;
                close(fd);
                return fail(ErrorKind::Io, std::format("Failed to mmap {}: {}", path.string(), std::strerror(saved)));
            }
            data = static_cast<char *>(addr);
        }
        // The mapping stays valid after the descriptor is closed.
        close(fd);
        return std::make_shared<MappedFile>(Private{}, data, size);
    }

    MappedFile(Private, char *data, size_t size) : data_(data), size_(size) {
    }

    ~MappedFile() {
        if (data_) {
            munmap(data_, size_);
        }
    }

    std::string_view content() const {
        if (!data_)
            return {};
        return {data_, size_};
    }

    MappedFile(const MappedFile &) = delete;
    MappedFile &operator=(const MappedFile &) = delete;

private:
    char *data_ = nullptr;
    size_t size_ = 0;
};

} // namespace kiln
