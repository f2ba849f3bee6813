#pragma once

#include <span>
#include <string>
#include <string_view>

#include <cassert>
#include <cstddef>
#include <cstdint>
#include <cstring>

#include <endian.h>

#include "header.hpp"

namespace hobeta {

inline bool Header::is_basic() const noexcept {
    return filetype == 'B';
}

inline std::string_view Header::file_type_name() const noexcept {
    switch (filetype) {
    case 'B':
        return "BASIC";
    case 'C':
        return "numeric array";
    case 'D':
        return "sequential file";
    case '#':
        return "byte array";
    default:
        return "unknown";
    }
}

inline std::string Header::filename_string() const {
    std::string name;
    name.reserve(filename.size());
    for (const std::uint8_t c : filename)
        name.push_back(c >= 0x20 && c < 0x7F ? static_cast<char>(c) : '?');

    return name;
}

namespace wire {

inline std::uint8_t get_u8(std::span<const std::byte> data, std::size_t offset) noexcept {
    assert(offset < data.size());

    return static_cast<std::uint8_t>(data[offset]);
}

inline std::uint16_t get_u16_le(std::span<const std::byte> data, std::size_t offset) noexcept {
    assert(offset + 2 <= data.size());

    std::uint16_t value;
    std::memcpy(&value, data.data() + offset, 2);
    return ::le16toh(value);
}

} // namespace wire

} // namespace hobeta
