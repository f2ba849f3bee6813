#pragma once

#include <stdexcept>
#include <string>

#include <cstddef>

namespace hobeta {

class TruncatedInputError : public std::runtime_error {
  public:
    TruncatedInputError(std::size_t expected, std::size_t actual)
        : std::runtime_error("truncated header: expected " + std::to_string(expected) + " bytes, got " +
                             std::to_string(actual)),
          expected_(expected), actual_(actual) {}

    [[nodiscard]] std::size_t expected() const noexcept {
        return expected_;
    }

    [[nodiscard]] std::size_t actual() const noexcept {
        return actual_;
    }

  private:
    std::size_t expected_;
    std::size_t actual_;
};

} // namespace hobeta
