#pragma once

#include <ostream>
#include <string>

#include <cstddef>
#include <cstdint>

#include <hobeta/extractor.hpp>
#include <hobeta/iouring/ring.hpp>

namespace hobeta {

struct Config {
    enum class Action { INFO, STRIP, HELP, VERSION };

    Action action{Action::HELP};

    std::string hobeta_path;
    std::string output_path;

    // Copy everything after the header instead of the declared length
    bool ignore_header{};

    std::size_t chunk_size{default_chunk_size};
    std::uint32_t io_uring_entries{IOUring::default_entries};
};

constexpr std::size_t max_chunk_size = 64 * 1024 * 1024;

// Throws std::invalid_argument on malformed command lines. Sets verbose_mode on '-V'.
void parse_arguments(Config& config, int argn, char* argv[]);

void print_help(std::ostream& out, const std::string& program_name);
void print_version(std::ostream& out);

} // namespace hobeta
