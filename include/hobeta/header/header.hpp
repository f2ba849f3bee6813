#pragma once

#include <array>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

namespace hobeta {

// Hobeta header as stored in front of the payload:
//
//  0       8 9   11  13 14 15  17
// +--------+-+---+---+--+--+---+----------
// |FILENAME|T| S | L |F |C |CHK| payload...
// +--------+-+---+---+--+--+---+----------
//
// All multi-byte fields are little-endian. CHK covers bytes [0, 15).
struct Header {
    static constexpr std::size_t filename_size = 8;
    static constexpr std::size_t wire_size = 17;
    static constexpr std::size_t checksummed_size = wire_size - 2;

    std::array<std::uint8_t, filename_size> filename{};
    std::uint8_t filetype{};
    std::uint16_t start{};
    std::uint16_t length{};
    std::uint8_t first_sector{};
    std::uint8_t occupied_sectors{};
    std::uint16_t check_sum{};

    // 'B' headers carry the program length in `start`, every other type carries a load address.
    [[nodiscard]] bool is_basic() const noexcept;

    [[nodiscard]] std::string_view file_type_name() const noexcept;
    [[nodiscard]] std::string filename_string() const;

    bool operator==(const Header&) const noexcept = default;
};

namespace wire {

constexpr std::size_t filename_offset = 0;
constexpr std::size_t filetype_offset = 8;
constexpr std::size_t start_offset = 9;
constexpr std::size_t length_offset = 11;
constexpr std::size_t first_sector_offset = 13;
constexpr std::size_t occupied_sectors_offset = 14;
constexpr std::size_t check_sum_offset = 15;

} // namespace wire

} // namespace hobeta

#include "header.inl"
