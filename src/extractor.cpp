#include <algorithm>
#include <span>
#include <stdexcept>
#include <vector>

#include <cstddef>
#include <cstdint>

#include <hobeta/extractor.hpp>
#include <hobeta/header/header.hpp>
#include <hobeta/io/byte_sink.hpp>
#include <hobeta/io/byte_source.hpp>
#include <hobeta/tools/debug.hpp>

std::uint64_t hobeta::plan_budget(const Header& header, bool ignore_declared_length, const ByteSource& source) {
    if (!ignore_declared_length)
        return header.length;

    const std::uint64_t total = source.total_size();
    return total > Header::wire_size ? total - Header::wire_size : 0;
}

std::uint64_t hobeta::copy(const Header& header, bool crc_ok, bool ignore_declared_length, ByteSource& source,
                           ByteSink& sink, std::size_t chunk_size) {
    if (chunk_size == 0)
        throw std::invalid_argument("chunk size must be positive");

    const std::uint64_t budget = plan_budget(header, ignore_declared_length, source);
    VERBOSE_LOG("copy: budget %llu bytes (%s, crc %s)", static_cast<unsigned long long>(budget),
                ignore_declared_length ? "declared length ignored" : "declared length", crc_ok ? "ok" : "wrong");

    source.seek(Header::wire_size);

    std::vector<std::byte> buffer(static_cast<std::size_t>(std::min<std::uint64_t>(chunk_size, budget)));
    std::uint64_t remaining = budget;

    while (remaining) {
        const auto want = static_cast<std::size_t>(std::min<std::uint64_t>(buffer.size(), remaining));
        const std::size_t got = source.read(std::span<std::byte>{buffer}.first(want));
        if (got == 0) {
            VERBOSE_LOG("copy: source exhausted with %llu bytes left", static_cast<unsigned long long>(remaining));
            break;
        }

        sink.write(std::span<const std::byte>{buffer}.first(got));
        remaining -= got;
    }

    return budget - remaining;
}
