#include <atomic>
#include <ostream>
#include <stdexcept>
#include <string>
#include <string_view>

#include <cstddef>

#include <getopt.h>
#include <unistd.h>

#include <hobeta/config.hpp>
#include <hobeta/tools/debug.hpp>

std::atomic_bool hobeta::verbose_mode{false};

void hobeta::print_help(std::ostream& out, const std::string& program_name) {
    out << "Usage:" << std::endl;
    out << program_name << " [-V] [-b <bytes>] info <hobeta-file>" << std::endl;
    out << program_name << " [-V] [-b <bytes>] [-i] strip <hobeta-file> <output-file>" << std::endl;
    out << std::endl;
    out << "info \t\t\tShow information about the specified Hobeta file." << std::endl;
    out << "strip \t\t\tStrip Hobeta header." << std::endl;
    out << std::endl;
    out << "-i, --ignore-header \tIgnore the file size from Hobeta header." << std::endl;
    out << "-b <bytes> \t\tCopy buffer size. Range 1-" << max_chunk_size << ". Defaults: " << default_chunk_size
        << "." << std::endl;
    out << "-V, --verbose \t\tIncrease output verbosity." << std::endl;
    out << std::endl;
    out << "-h \tPrint this help info." << std::endl;
    out << "-v \tPrint version." << std::endl;
}

void hobeta::print_version(std::ostream& out) {
    out << PROJECT_NAME << " " << HOBETA_VERSION << std::endl;
    out << "Licensed under MIT license" << std::endl;
}

void hobeta::parse_arguments(Config& config, int argn, char* argv[]) {
    static const option long_options[] = {
        {"ignore-header", no_argument, nullptr, 'i'},
        {"ignore_header", no_argument, nullptr, 'i'},
        {"verbose", no_argument, nullptr, 'V'},
        {"help", no_argument, nullptr, 'h'},
        {"version", no_argument, nullptr, 'v'},
        {nullptr, 0, nullptr, 0},
    };

    // Zero forces glibc to reinitialize its scanner between calls.
    optind = 0;

    int opt;
    while ((opt = ::getopt_long(argn, argv, ":b:iVhv", long_options, nullptr)) != -1) {
        switch (opt) {
        case 'b': {
            const auto unvalidated_size = std::stoll(optarg);
            if (unvalidated_size < 1 || static_cast<unsigned long long>(unvalidated_size) > max_chunk_size)
                throw std::invalid_argument("buffer size must be min 1 max " + std::to_string(max_chunk_size));

            config.chunk_size = static_cast<std::size_t>(unvalidated_size);
        } break;

        case 'i':
            config.ignore_header = true;
            break;

        case 'V':
            verbose_mode.store(true, std::memory_order_relaxed);
            break;

        case 'h':
            config.action = Config::Action::HELP;
            return;

        case 'v':
            config.action = Config::Action::VERSION;
            return;

        case ':':
            throw std::invalid_argument(std::string("missing argument for '-") + char(optopt) + "'");

        case '?':
            if (optopt)
                throw std::invalid_argument(std::string("unknown option '-") + char(optopt) + "'");
            throw std::invalid_argument(std::string("unknown option '") + argv[optind - 1] + "'");
        }
    }

    if (optind == argn)
        throw std::invalid_argument("command is not set");

    const std::string_view command = argv[optind++];
    const int operands = argn - optind;

    if (command == "info") {
        if (operands != 1)
            throw std::invalid_argument("'info' expects exactly one file");
        if (config.ignore_header)
            throw std::invalid_argument("'-i' has no effect with 'info'");

        config.action = Config::Action::INFO;
        config.hobeta_path = argv[optind];

    } else if (command == "strip") {
        if (operands != 2)
            throw std::invalid_argument("'strip' expects an input and an output file");

        config.action = Config::Action::STRIP;
        config.hobeta_path = argv[optind];
        config.output_path = argv[optind + 1];

    } else {
        throw std::invalid_argument("unknown command '" + std::string(command) + "'");
    }
}
