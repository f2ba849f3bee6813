#include <stdexcept>
#include <system_error>
#include <utility>

#include <cerrno>
#include <cstdint>

#include <liburing.h>

#include <hobeta/iouring/cqe.hpp>
#include <hobeta/iouring/ring.hpp>

hobeta::IOUring::IOUring(std::uint32_t entries) {
    if (const int result = ::io_uring_queue_init(entries, &ring_, 0); result < 0) {
        ring_.ring_fd = -1;
        throw std::system_error(-result, std::system_category(), "io_uring_queue_init");
    }
}

hobeta::IOUring::IOUring(IOUring&& other) noexcept : ring_(std::exchange(other.ring_, io_uring{})) {
    other.ring_.ring_fd = -1;
}

hobeta::IOUring& hobeta::IOUring::operator=(IOUring&& other) noexcept {
    if (&other == this)
        return *this;

    close();
    ring_ = std::exchange(other.ring_, io_uring{});
    other.ring_.ring_fd = -1;

    return *this;
}

hobeta::IOUring::~IOUring() noexcept {
    close();
}

void hobeta::IOUring::close() noexcept {
    if (ring_.ring_fd < 0)
        return;

    ::io_uring_queue_exit(&ring_);
    ring_ = io_uring{};
    ring_.ring_fd = -1;
}

io_uring* hobeta::IOUring::get() noexcept {
    return &ring_;
}

bool hobeta::IOUring::is_valid() const noexcept {
    return ring_.ring_fd >= 0;
}

hobeta::IOUring::operator bool() const noexcept {
    return is_valid();
}

io_uring_sqe* hobeta::IOUring::get_sqe() {
    if (!is_valid())
        throw std::logic_error("ring is closed");

    if (io_uring_sqe* sqe = ::io_uring_get_sqe(&ring_))
        return sqe;

    throw std::runtime_error("no free SQE available");
}

hobeta::Cqe hobeta::IOUring::wait_cqe() {
    if (!is_valid())
        throw std::logic_error("ring is closed");

    io_uring_cqe* cqe = nullptr;
    for (;;) {
        const int result = ::io_uring_wait_cqe(&ring_, &cqe);
        if (result == -EINTR)
            continue;
        else if (result < 0)
            throw std::system_error(-result, std::generic_category(), "io_uring_wait_cqe");

        break;
    }

    if (!cqe)
        throw std::runtime_error("io_uring_wait_cqe returned null CQE");

    const Cqe copy{*cqe};
    ::io_uring_cqe_seen(&ring_, cqe);

    return copy;
}

void hobeta::IOUring::submit() {
    if (!is_valid())
        throw std::logic_error("ring is closed");

    if (const int result = ::io_uring_submit(&ring_); result < 0)
        throw std::system_error(-result, std::system_category(), "io_uring_submit");
}

std::uint32_t hobeta::IOUring::get_sq_entries() const noexcept {
    if (!is_valid())
        return 0;

    return ring_.sq.ring_entries;
}
