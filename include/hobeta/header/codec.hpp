#pragma once

#include <span>

#include <cstddef>
#include <cstdint>

#include <hobeta/header/header.hpp>

namespace hobeta {

class ByteSource;

struct DecodedHeader {
    Header header;
    std::uint16_t computed_checksum{};
};

[[nodiscard]] Header decode(std::span<const std::byte, Header::wire_size> data) noexcept;

// Throws TruncatedInputError when fewer than Header::wire_size bytes are given.
[[nodiscard]] Header decode(std::span<const std::byte> data);

// acc = (acc + b * 257 + i) mod 2^16 for every byte b at index i.
[[nodiscard]] std::uint16_t checksum(std::span<const std::byte> data) noexcept;

[[nodiscard]] bool verify(const Header& header, std::uint16_t computed_checksum) noexcept;

// Reads the header from the beginning of the source and checksums its first 15 bytes.
[[nodiscard]] DecodedHeader read_header(ByteSource& source);

} // namespace hobeta
