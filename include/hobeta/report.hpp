#pragma once

#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include <hobeta/header/header.hpp>

namespace hobeta {

constexpr std::size_t report_label_width = 20;

[[nodiscard]] std::string format_info(const Header& header, std::uint16_t computed_checksum);
[[nodiscard]] std::string format_strip_result(std::string_view output_name, std::uint64_t bytes_copied);
[[nodiscard]] std::string_view checksum_warning() noexcept;

} // namespace hobeta
