#pragma once

#include <cstdint>

#include <liburing.h>

#include <hobeta/iouring/ring.hpp>

namespace hobeta {

class Cqe {
  public:
    friend class IOUring;

    std::uint64_t get_data64() const noexcept;

    std::int32_t get_result() const noexcept;
    std::uint32_t get_flags() const noexcept;

    [[nodiscard]] bool ok() const noexcept;
    [[nodiscard]] int error() const noexcept;

  private:
    explicit Cqe(const io_uring_cqe& cqe) noexcept;

    std::uint64_t user_data_;
    std::int32_t res_;
    std::uint32_t flags_;
};

} // namespace hobeta
