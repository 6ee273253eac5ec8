#include "sandtool/file_descriptor.hh"

#include <cerrno>
#include <unistd.h>

int FileDescriptor::close() noexcept {
    if (fd_ < 0) {
        return 0;
    }
    int rc = ::close(fd_);
    fd_ = -1;
    return rc;
}

size_t write_all(int fd, const void* buff, size_t len) noexcept {
    const auto* data = static_cast<const char*>(buff);
    size_t written = 0;
    while (written < len) {
        auto rc = write(fd, data + written, len - written);
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        written += static_cast<size_t>(rc);
    }
    return written;
}

size_t pread_all(int fd, off_t pos, void* buff, size_t len) noexcept {
    auto* data = static_cast<char*>(buff);
    size_t got = 0;
    while (got < len) {
        auto rc = pread(fd, data + got, len - got, pos + static_cast<off_t>(got));
        if (rc < 0) {
            if (errno == EINTR) {
                continue;
            }
            break;
        }
        if (rc == 0) {
            errno = 0;
            break;
        }
        got += static_cast<size_t>(rc);
    }
    return got;
}
