#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <cerrno>
#include <cstdint>

#include <fcntl.h>
#include <sys/stat.h>
#include <unistd.h>

#include <hobeta/tools/debug.hpp>
#include <hobeta/tools/file_descriptor.hpp>

hobeta::FileDescriptor::FileDescriptor(int fd) noexcept : fd_(fd) {}

hobeta::FileDescriptor::FileDescriptor(FileDescriptor&& other) noexcept : fd_(std::exchange(other.fd_, invalid_fd)) {}

hobeta::FileDescriptor& hobeta::FileDescriptor::operator=(FileDescriptor&& other) noexcept {
    if (&other == this)
        return *this;

    close();
    fd_ = std::exchange(other.fd_, invalid_fd);

    return *this;
}

hobeta::FileDescriptor::~FileDescriptor() noexcept {
    close();
}

void hobeta::FileDescriptor::reset(int fd) noexcept {
    if (fd == fd_)
        return;
    if (is_valid())
        if (::close(fd_) != 0)
            DEBUG_ERRNO(errno, "close");
    fd_ = fd;
}

void hobeta::FileDescriptor::close() noexcept {
    reset();
}

int hobeta::FileDescriptor::get() const noexcept {
    return fd_;
}

int hobeta::FileDescriptor::release() noexcept {
    return std::exchange(fd_, invalid_fd);
}

bool hobeta::FileDescriptor::is_valid() const noexcept {
    return fd_ >= 0;
}

hobeta::FileDescriptor::operator bool() const noexcept {
    return is_valid();
}

std::uint64_t hobeta::FileDescriptor::size() const {
    if (!is_valid())
        throw std::logic_error("file descriptor is invalid");

    struct stat st{};
    if (::fstat(fd_, &st) < 0)
        throw std::system_error(errno, std::generic_category(), "fstat");

    return static_cast<std::uint64_t>(st.st_size);
}

void hobeta::FileDescriptor::swap(FileDescriptor& with) noexcept {
    std::swap(fd_, with.fd_);
}

hobeta::FileDescriptor hobeta::FileDescriptor::open(const std::string& path, int flags, mode_t mode) {
    const int fd = ::open(path.c_str(), flags | O_CLOEXEC, mode);
    if (fd < 0)
        throw std::system_error(errno, std::generic_category(), "open " + path);

    return FileDescriptor{fd};
}

void hobeta::swap(FileDescriptor& a, FileDescriptor& b) noexcept {
    a.swap(b);
}
