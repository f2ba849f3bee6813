#pragma once

#include <span>
#include <string>

#include <cstddef>
#include <cstdint>

#include <hobeta/io/byte_sink.hpp>
#include <hobeta/io/byte_source.hpp>
#include <hobeta/iouring/ring.hpp>
#include <hobeta/tools/file_descriptor.hpp>

namespace hobeta {

// Positional reads through the borrowed ring, one SQE per call.
class FileSource final : public ByteSource {
  public:
    FileSource(IOUring& ring, FileDescriptor fd) noexcept;

    std::size_t read(std::span<std::byte> buffer) override;

    void seek(std::uint64_t offset) override;
    [[nodiscard]] std::uint64_t tell() const override;
    [[nodiscard]] std::uint64_t total_size() const override;

    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] static FileSource open(IOUring& ring, const std::string& path);

  private:
    IOUring* ring_;
    FileDescriptor fd_;
    std::uint64_t offset_{};
};

class FileSink final : public ByteSink {
  public:
    FileSink(IOUring& ring, FileDescriptor fd) noexcept;

    void write(std::span<const std::byte> data) override;

    void close() noexcept;
    [[nodiscard]] bool is_open() const noexcept;

    [[nodiscard]] std::uint64_t written() const noexcept;

    // Creates or truncates the file.
    [[nodiscard]] static FileSink create(IOUring& ring, const std::string& path);

  private:
    IOUring* ring_;
    FileDescriptor fd_;
    std::uint64_t offset_{};
};

} // namespace hobeta
