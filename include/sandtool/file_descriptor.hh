#pragma once

#include <fcntl.h>
#include <string>
#include <string_view>
#include <utility>

// Owning wrapper around a file descriptor, closes it on destruction
class FileDescriptor {
    int fd_;

public:
    FileDescriptor() noexcept
    : fd_{-1} {}

    explicit FileDescriptor(int fd) noexcept
    : fd_{fd} {}

    FileDescriptor(const FileDescriptor&) = delete;
    FileDescriptor& operator=(const FileDescriptor&) = delete;

    FileDescriptor(FileDescriptor&& other) noexcept
    : fd_{std::exchange(other.fd_, -1)} {}

    FileDescriptor& operator=(FileDescriptor&& other) noexcept {
        if (this != &other) {
            (void)close();
            fd_ = std::exchange(other.fd_, -1);
        }
        return *this;
    }

    ~FileDescriptor() { (void)close(); }

    [[nodiscard]] bool is_open() const noexcept { return fd_ >= 0; }

    // Returns 0 on success and -1 on error; either way the descriptor is no longer owned
    int close() noexcept;

    // NOLINTNEXTLINE(google-explicit-constructor)
    operator int() const noexcept { return fd_; }
};

// Writes the whole buffer unless an error occurs; returns the number of bytes written
size_t write_all(int fd, const void* buff, size_t len) noexcept;

inline size_t write_all(int fd, std::string_view str) noexcept {
    return write_all(fd, str.data(), str.size());
}

// Reads @p len bytes starting at @p pos unless EOF or an error occurs; returns the number of
// bytes read; errno is 0 if EOF was reached
size_t pread_all(int fd, off_t pos, void* buff, size_t len) noexcept;
