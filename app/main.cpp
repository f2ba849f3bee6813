#include <exception>
#include <iostream>
#include <stdexcept>
#include <system_error>

#include <cstdlib>

#include <hobeta/config.hpp>
#include <hobeta/error.hpp>
#include <hobeta/extractor.hpp>
#include <hobeta/header/codec.hpp>
#include <hobeta/io/file.hpp>
#include <hobeta/iouring/ring.hpp>
#include <hobeta/report.hpp>

int main(int argn, char* argv[]) {
    hobeta::Config config;

    try {
        hobeta::parse_arguments(config, argn, argv);
    } catch (const std::invalid_argument& e) {
        std::cout << "Wrong argument: " << e.what() << std::endl;
        hobeta::print_help(std::cout, argv[0]);
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cout << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    switch (config.action) {
    case hobeta::Config::Action::HELP:
        hobeta::print_help(std::cout, argv[0]);
        return EXIT_SUCCESS;

    case hobeta::Config::Action::VERSION:
        hobeta::print_version(std::cout);
        return EXIT_SUCCESS;

    default:
        break;
    }

    try {
        hobeta::IOUring ring{config.io_uring_entries};
        auto source = hobeta::FileSource::open(ring, config.hobeta_path);

        const auto [header, crc] = hobeta::read_header(source);
        const bool crc_ok = hobeta::verify(header, crc);

        if (config.action == hobeta::Config::Action::INFO) {
            std::cout << hobeta::format_info(header, crc);
            return EXIT_SUCCESS;
        }

        if (!crc_ok)
            std::cout << hobeta::checksum_warning() << std::endl;

        auto sink = hobeta::FileSink::create(ring, config.output_path);
        const auto copied = hobeta::copy(header, crc_ok, config.ignore_header, source, sink, config.chunk_size);

        sink.close();
        source.close();

        std::cout << hobeta::format_strip_result(config.output_path, copied) << std::endl;

    } catch (const hobeta::TruncatedInputError& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::system_error& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return EXIT_FAILURE;
    } catch (const std::exception& e) {
        std::cerr << "Exception: " << e.what() << std::endl;
        return EXIT_FAILURE;
    }

    return EXIT_SUCCESS;
}
