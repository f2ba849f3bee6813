#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

namespace hobeta {

class ByteSource {
  public:
    virtual ~ByteSource() = default;

    // Returns fewer bytes than requested only at end of stream, 0 once exhausted.
    virtual std::size_t read(std::span<std::byte> buffer) = 0;

    virtual void seek(std::uint64_t offset) = 0;
    [[nodiscard]] virtual std::uint64_t tell() const = 0;
    [[nodiscard]] virtual std::uint64_t total_size() const = 0;
};

} // namespace hobeta
