#include <algorithm>
#include <limits>
#include <span>
#include <stdexcept>
#include <string>
#include <system_error>
#include <utility>

#include <cerrno>
#include <cstddef>
#include <cstdint>

#include <fcntl.h>
#include <liburing.h>

#include <hobeta/io/file.hpp>
#include <hobeta/iouring/cqe.hpp>
#include <hobeta/iouring/ring.hpp>
#include <hobeta/tools/debug.hpp>
#include <hobeta/tools/file_descriptor.hpp>

namespace {

constexpr std::size_t max_single_io = std::numeric_limits<unsigned>::max() / 2;

enum class IoOp : std::uint64_t { READ = 1, WRITE = 2 };

} // namespace

hobeta::FileSource::FileSource(IOUring& ring, FileDescriptor fd) noexcept : ring_(&ring), fd_(std::move(fd)) {}

std::size_t hobeta::FileSource::read(std::span<std::byte> buffer) {
    if (!fd_)
        throw std::logic_error("source is closed");

    if (buffer.empty())
        return 0;

    const auto size = static_cast<unsigned>(std::min(buffer.size(), max_single_io));

    for (;;) {
        io_uring_sqe* sqe = ring_->get_sqe();
        ::io_uring_prep_read(sqe, fd_.get(), buffer.data(), size, offset_);
        ::io_uring_sqe_set_data64(sqe, static_cast<std::uint64_t>(IoOp::READ));
        ring_->submit();

        const Cqe cqe = ring_->wait_cqe();
        if (cqe.error() == EINTR || cqe.error() == EAGAIN)
            continue;

        if (!cqe.ok())
            throw std::system_error(cqe.error(), std::generic_category(), "read");

        const auto got = static_cast<std::size_t>(cqe.get_result());
        offset_ += got;

        return got;
    }
}

void hobeta::FileSource::seek(std::uint64_t offset) {
    offset_ = offset;
}

std::uint64_t hobeta::FileSource::tell() const {
    return offset_;
}

std::uint64_t hobeta::FileSource::total_size() const {
    return fd_.size();
}

void hobeta::FileSource::close() noexcept {
    fd_.close();
}

bool hobeta::FileSource::is_open() const noexcept {
    return fd_.is_valid();
}

hobeta::FileSource hobeta::FileSource::open(IOUring& ring, const std::string& path) {
    return FileSource{ring, FileDescriptor::open(path, O_RDONLY)};
}

hobeta::FileSink::FileSink(IOUring& ring, FileDescriptor fd) noexcept : ring_(&ring), fd_(std::move(fd)) {}

void hobeta::FileSink::write(std::span<const std::byte> data) {
    if (!fd_)
        throw std::logic_error("sink is closed");

    while (!data.empty()) {
        const auto size = static_cast<unsigned>(std::min(data.size(), max_single_io));

        io_uring_sqe* sqe = ring_->get_sqe();
        ::io_uring_prep_write(sqe, fd_.get(), data.data(), size, offset_);
        ::io_uring_sqe_set_data64(sqe, static_cast<std::uint64_t>(IoOp::WRITE));
        ring_->submit();

        const Cqe cqe = ring_->wait_cqe();
        if (cqe.error() == EINTR || cqe.error() == EAGAIN)
            continue;

        if (!cqe.ok())
            throw std::system_error(cqe.error(), std::generic_category(), "write");

        const auto put = static_cast<std::size_t>(cqe.get_result());
        if (put == 0)
            throw std::system_error(EIO, std::generic_category(), "write returned 0");

        if (put < size)
            DEBUG_LOG("short write: %zu of %u bytes", put, size);

        offset_ += put;
        data = data.subspan(put);
    }
}

void hobeta::FileSink::close() noexcept {
    fd_.close();
}

bool hobeta::FileSink::is_open() const noexcept {
    return fd_.is_valid();
}

std::uint64_t hobeta::FileSink::written() const noexcept {
    return offset_;
}

hobeta::FileSink hobeta::FileSink::create(IOUring& ring, const std::string& path) {
    return FileSink{ring, FileDescriptor::open(path, O_WRONLY | O_CREAT | O_TRUNC, 0644)};
}
