#include <cstdint>

#include <liburing.h>

#include <hobeta/iouring/cqe.hpp>

std::uint64_t hobeta::Cqe::get_data64() const noexcept {
    return user_data_;
}

std::int32_t hobeta::Cqe::get_result() const noexcept {
    return res_;
}

std::uint32_t hobeta::Cqe::get_flags() const noexcept {
    return flags_;
}

hobeta::Cqe::Cqe(const io_uring_cqe& cqe) noexcept : user_data_(cqe.user_data), res_(cqe.res), flags_(cqe.flags) {}

bool hobeta::Cqe::ok() const noexcept {
    return res_ >= 0;
}

int hobeta::Cqe::error() const noexcept {
    return res_ < 0 ? -res_ : 0;
}
