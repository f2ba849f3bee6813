#pragma once

#include <cstddef>
#include <cstdint>

#include <hobeta/header/header.hpp>

namespace hobeta {

class ByteSink;
class ByteSource;

constexpr std::size_t default_chunk_size = 512 * 1024;

// Bytes `copy` will try to move: the declared length, or everything after the header when
// the declared length is ignored.
[[nodiscard]] std::uint64_t plan_budget(const Header& header, bool ignore_declared_length, const ByteSource& source);

// Moves the payload from `source` to `sink` in chunks of at most `chunk_size` bytes and returns
// the number of bytes actually written. Running out of source before the budget is spent is not
// an error. `crc_ok` is only reported, it never changes what gets copied.
std::uint64_t copy(const Header& header, bool crc_ok, bool ignore_declared_length, ByteSource& source, ByteSink& sink,
                   std::size_t chunk_size = default_chunk_size);

} // namespace hobeta
