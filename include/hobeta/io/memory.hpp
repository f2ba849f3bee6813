#pragma once

#include <span>
#include <vector>

#include <cstddef>
#include <cstdint>

#include <hobeta/io/byte_sink.hpp>
#include <hobeta/io/byte_source.hpp>

namespace hobeta {

class MemorySource final : public ByteSource {
  public:
    MemorySource() noexcept = default;
    explicit MemorySource(std::vector<std::byte> data) noexcept;

    std::size_t read(std::span<std::byte> buffer) override;

    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() const override;
    [[nodiscard]] std::uint64_t total_size() const override;

  private:
    std::vector<std::byte> data_;
    std::uint64_t position_{};
};

class MemorySink final : public ByteSink {
  public:
    void write(std::span<const std::byte> data) override;

    [[nodiscard]] const std::vector<std::byte>& data() const noexcept;
    [[nodiscard]] std::size_t write_count() const noexcept;

  private:
    std::vector<std::byte> data_;
    std::size_t write_count_{};
};

} // namespace hobeta
