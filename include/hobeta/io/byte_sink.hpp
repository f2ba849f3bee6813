#pragma once

#include <span>

#include <cstddef>

namespace hobeta {

class ByteSink {
  public:
    virtual ~ByteSink() = default;

    // Writes the whole span or throws.
    virtual void write(std::span<const std::byte> data) = 0;
};

} // namespace hobeta
