#include <sstream>
#include <string>
#include <string_view>

#include <cstddef>
#include <cstdint>

#include <hobeta/header/codec.hpp>
#include <hobeta/header/header.hpp>
#include <hobeta/report.hpp>

namespace {

constexpr auto line = [](std::ostringstream& out, std::string_view label, const auto& value) {
    out << label;
    for (std::size_t pad = label.size(); pad < hobeta::report_label_width; ++pad)
        out << ' ';
    out << value << '\n';
};

char printable(std::uint8_t c) noexcept {
    return c >= 0x20 && c < 0x7F ? static_cast<char>(c) : '?';
}

} // namespace

std::string hobeta::format_info(const Header& header, std::uint16_t computed_checksum) {
    std::ostringstream out;

    line(out, "File name:", header.filename_string());
    line(out, "Extension:", printable(header.filetype));
    line(out, header.is_basic() ? "Prg LEN:" : "Place at:", header.start);
    line(out, "File size:", header.length);
    line(out, "First sector:", static_cast<unsigned>(header.first_sector));
    line(out, "Occupied sectors:", static_cast<unsigned>(header.occupied_sectors));

    std::string check = std::to_string(header.check_sum);
    if (verify(header, computed_checksum))
        check += " (OK)";
    else
        check += " (WRONG! Should be " + std::to_string(computed_checksum) + ")";
    line(out, "Check sum:", check);

    return out.str();
}

std::string hobeta::format_strip_result(std::string_view output_name, std::uint64_t bytes_copied) {
    std::ostringstream out;
    out << "Created file " << output_name << ", " << bytes_copied << " bytes copied.";
    return out.str();
}

std::string_view hobeta::checksum_warning() noexcept {
    return "WARNING: wrong checksum in the header.";
}
