#include "kiln/mmap.hpp"

#include <cerrno>
#include <cstring>
#include <fcntl.h>
#include <format>
#include <sys/mman.h>
#include <sys/stat.h>
#include <unistd.h>

namespace kiln {

namespace {

std::unexpected<Error> errno_error(std::string_view what, const std::filesystem::path &path) {
    return fail(ErrorKind::File, std::format("{} '{}': {}", what, path.string(), std::strerror(errno)));
}

} // namespace

Result<std::unique_ptr<MappedFile>> MappedFile::open(const std::filesystem::path &path) {
    std::unique_ptr<MappedFile> file(new MappedFile());

    file->fd_ = ::open(path.c_str(), O_RDONLY);
    if (file->fd_ == -1) {
        return errno_error("Could not open", path);
    }

    struct stat sb;
    if (fstat(file->fd_, &sb) == -1) {
        return errno_error("Could not stat", path);
    }
    if (!S_ISREG(sb.st_mode)) {
        return fail(ErrorKind::File, std::format("Could not read '{}': not a regular file", path.string()));
    }
    file->size_ = static_cast<size_t>(sb.st_size);

    if (file->size_ == 0) {
        return file;
    }

    posix_fadvise(file->fd_, 0, 0, POSIX_FADV_SEQUENTIAL);

    void *addr = mmap(nullptr, file->size_, PROT_READ, MAP_PRIVATE, file->fd_, 0);
    if (addr == MAP_FAILED) {
        return errno_error("Could not map", path);
    }
    file->data_ = static_cast<char *>(addr);
    return file;
}

MappedFile::~MappedFile() {
    if (data_) {
        munmap(data_, size_);
    }
    if (fd_ != -1) {
        close(fd_);
    }
}

} // namespace kiln
