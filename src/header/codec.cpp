#include <array>
#include <span>

#include <cstddef>
#include <cstdint>

#include <hobeta/error.hpp>
#include <hobeta/header/codec.hpp>
#include <hobeta/header/header.hpp>
#include <hobeta/io/byte_source.hpp>
#include <hobeta/tools/debug.hpp>

hobeta::Header hobeta::decode(std::span<const std::byte, Header::wire_size> data) noexcept {
    Header header;

    for (std::size_t i = 0; i < Header::filename_size; ++i)
        header.filename[i] = wire::get_u8(data, wire::filename_offset + i);

    header.filetype = wire::get_u8(data, wire::filetype_offset);
    header.start = wire::get_u16_le(data, wire::start_offset);
    header.length = wire::get_u16_le(data, wire::length_offset);
    header.first_sector = wire::get_u8(data, wire::first_sector_offset);
    header.occupied_sectors = wire::get_u8(data, wire::occupied_sectors_offset);
    header.check_sum = wire::get_u16_le(data, wire::check_sum_offset);

    return header;
}

hobeta::Header hobeta::decode(std::span<const std::byte> data) {
    if (data.size() < Header::wire_size)
        throw TruncatedInputError(Header::wire_size, data.size());

    return decode(data.first<Header::wire_size>());
}

std::uint16_t hobeta::checksum(std::span<const std::byte> data) noexcept {
    std::uint16_t sum = 0;

    for (std::size_t i = 0; i < data.size(); ++i) {
        const auto value = static_cast<std::uint16_t>(data[i]);
        sum = static_cast<std::uint16_t>(sum + value * 257u + static_cast<std::uint16_t>(i));
    }

    return sum;
}

bool hobeta::verify(const Header& header, std::uint16_t computed_checksum) noexcept {
    return header.check_sum == computed_checksum;
}

hobeta::DecodedHeader hobeta::read_header(ByteSource& source) {
    std::array<std::byte, Header::wire_size> raw{};
    std::size_t filled = 0;

    source.seek(0);
    while (filled < raw.size()) {
        const std::size_t got = source.read(std::span<std::byte>{raw}.subspan(filled));
        if (got == 0)
            break;

        filled += got;
    }

    VERBOSE_LOG("header: %zu of %zu bytes read", filled, Header::wire_size);

    if (filled < Header::wire_size)
        throw TruncatedInputError(Header::wire_size, filled);

    DecodedHeader result{
        .header = decode(std::span<const std::byte, Header::wire_size>{raw}),
        .computed_checksum = checksum(std::span<const std::byte>{raw}.first(Header::checksummed_size)),
    };

    const Header& h = result.header;
    VERBOSE_LOG("header: filename='%s' filetype=0x%02x start=%u length=%u first_sector=%u occupied_sectors=%u "
                "check_sum=%u computed=%u",
                h.filename_string().c_str(), h.filetype, h.start, h.length, h.first_sector, h.occupied_sectors,
                h.check_sum, result.computed_checksum);

    return result;
}
