/**
 * main.cpp — rangebench_transpose, pivots benchmark CSV from stdin for plotting
 *
 *   ./rangebench_demo | rangebench_transpose
 *   ./rangebench_demo | rangebench_transpose --file sizes.csv   # raw rows still shown on stdout
 */

#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>

#include "../argparser/argparser.hxx"
#include "../errors/errors.hxx"
#include "../logger/logger.hxx"
#include "transpose.hxx"

auto main(int argc, char* argv[]) -> int {
    rangebench::cli::ArgParser parser("rangebench_transpose", "Reads `Name,Time (ns)` CSV on stdin and writes `Size,<family>,...` CSV.");
    parser.add<std::filesystem::path>("file").shorthand('f').description("Write the table to this file and echo the input on stdout");
    parser.add<bool>("verbose").shorthand('v').description("Log progress on stderr").default_val(false);

    if (!rangebench::cli::argparser_parse(parser, argc, argv)) {
        return EXIT_FAILURE;
    }
    if (parser.help_requested()) {
        parser.print_help();
        return EXIT_SUCCESS;
    }

    auto& log = rangebench::Logger::get_instance();
    log.initialize(parser.get<bool>("verbose") ? rangebench::Logger::level::DEBUG : rangebench::Logger::level::WARNING);

    const bool to_file = parser.has("file");
    std::ostringstream table;
    try {
        rangebench::transpose(std::cin, table, to_file ? &std::cout : nullptr);
    } catch (const rangebench::TransposeError& e) {
        RB_LOG_ERROR << "stdin " << e.what();
        return EXIT_FAILURE;
    }

    if (to_file) {
        const auto path = parser.get<std::filesystem::path>("file");
        std::ofstream out(path);
        if (out) {
            out << table.str();
            RB_LOG_DEBUG << "wrote " << path.string();
            return out.good() ? EXIT_SUCCESS : EXIT_FAILURE;
        }
        RB_LOG_ERROR << "could not open " << path.string() << ", writing the table to stdout instead";
    }

    std::cout << table.str();
    return std::cout.good() ? EXIT_SUCCESS : EXIT_FAILURE;
}
