#pragma once

#include <cstdint>

#include <liburing.h>

namespace hobeta {

class Cqe;

class IOUring {
  public:
    explicit IOUring(std::uint32_t entries);

    IOUring(IOUring&&) noexcept;
    IOUring& operator=(IOUring&&) noexcept;

    IOUring(const IOUring&) = delete;
    IOUring& operator=(const IOUring&) = delete;

    ~IOUring() noexcept;
    void close() noexcept;

    [[nodiscard]] io_uring* get() noexcept;

    [[nodiscard]] bool is_valid() const noexcept;
    [[nodiscard]] explicit operator bool() const noexcept;

    [[nodiscard]] io_uring_sqe* get_sqe();
    [[nodiscard]] Cqe wait_cqe();

    void submit();

    [[nodiscard]] std::uint32_t get_sq_entries() const noexcept;

    static constexpr std::uint32_t default_entries{8};

  private:
    io_uring ring_{};
};

} // namespace hobeta
