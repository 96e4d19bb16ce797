#include <filesystem>
#include <fstream>
#include <sstream>
#include <string>
#include <vector>

#include "../testing/test_main.hpp"
#include "argparser.hxx"

using rangebench::cli::ArgParser;
using rangebench::cli::ParseError;
namespace fs = std::filesystem;

namespace {

auto make_parser() -> ArgParser {
    ArgParser parser("prog", "test parser");
    parser.add<int>("runs").shorthand('r').default_val(8).min(1).max(1000);
    parser.add<double>("seconds").shorthand('d').default_val(1.0).min(0.0);
    parser.add<bool>("verbose").shorthand('v').default_val(false);
    parser.add<std::string>("name").shorthand('n');
    parser.add<std::string>("mode").allow<std::string>({"fast", "slow"}).default_val(std::string("fast"));
    parser.add<fs::path>("out");
    return parser;
}

auto write_toml(const std::string& name, const std::string& body) -> fs::path {
    auto path = fs::temp_directory_path() / name;
    std::ofstream file(path);
    file << body;
    return path;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Defaults and CLI values
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("cli values")

TEST_CASE("defaults apply when nothing is passed") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{});
    expect(parser.get<int>("runs")).to_equal(8);
    expect(parser.get<double>("seconds")).to_equal(1.0);
    expect(parser.get<bool>("verbose")).to_be_false();
    expect(parser.has("name")).to_be_false();
}

TEST_CASE("long and short names set values") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{"--runs", "3", "-d", "0.5", "-n", "vec", "--out", "x.csv"});
    expect(parser.get<int>("runs")).to_equal(3);
    expect(parser.get<double>("seconds")).to_equal(0.5);
    expect(parser.get<std::string>("name")).to_equal(std::string("vec"));
    expect(parser.get<fs::path>("out")).to_equal(fs::path("x.csv"));
}

TEST_CASE("a bare bool flag means true") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{"-v", "-r", "2"});
    expect(parser.get<bool>("verbose")).to_be_true();
    expect(parser.get<int>("runs")).to_equal(2);
}

TEST_CASE("a bool flag accepts an explicit value") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{"--verbose", "false"});
    expect(parser.get<bool>("verbose")).to_be_false();
}

TEST_CASE("argc/argv overload skips the program name") {
    auto parser = make_parser();
    const char* argv[] = {"prog", "-r", "5"};
    parser.parse(3, argv);
    expect(parser.get<int>("runs")).to_equal(5);
}

TEST_CASE("--help stops parsing and is reported") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{"-h", "--nonsense"});
    expect(parser.help_requested()).to_be_true();
}

TEST_CASE("help text lists every option with its default") {
    auto parser = make_parser();
    std::ostringstream out;
    parser.print_help(out);
    expect(out.str()).to_contain("--runs, -r <int>");
    expect(out.str()).to_contain("[default: 8]");
    expect(out.str()).to_contain("[choices: fast|slow]");
}

// ─────────────────────────────────────────────────────────────────────────────
// Rejections
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("cli rejections")

TEST_CASE("unknown long and short options") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse(std::vector<std::string>{"--iterations", "3"}));
    expect_throws(ParseError, parser.parse(std::vector<std::string>{"-x"}));
}

TEST_CASE("values outside min/max") {
    auto parser = make_parser();
    expect_throws_with(ParseError, "below minimum", parser.parse(std::vector<std::string>{"-r", "0"}));
    expect_throws_with(ParseError, "above maximum", parser.parse(std::vector<std::string>{"-r", "1001"}));
    expect_throws(ParseError, parser.parse(std::vector<std::string>{"-d", "-0.1"}));
}

TEST_CASE("numbers with trailing characters") {
    auto parser = make_parser();
    expect_throws(ParseError, parser.parse(std::vector<std::string>{"-r", "12abc"}));
    expect_throws(ParseError, parser.parse(std::vector<std::string>{"-d", "1.5s"}));
}

TEST_CASE("value outside the allowed choices") {
    auto parser = make_parser();
    expect_throws_with(ParseError, "allowed choices", parser.parse(std::vector<std::string>{"--mode", "medium"}));
}

TEST_CASE("repeated option") {
    auto parser = make_parser();
    expect_throws_with(ParseError, "duplicate", parser.parse(std::vector<std::string>{"-r", "1", "--runs", "2"}));
}

TEST_CASE("missing value") {
    auto parser = make_parser();
    expect_throws_with(ParseError, "requires a value", parser.parse(std::vector<std::string>{"--name"}));
}

TEST_CASE("required option absent") {
    ArgParser parser("prog");
    parser.add<int>("must").require();
    expect_throws_with(ParseError, "required", parser.parse(std::vector<std::string>{}));
}

TEST_CASE("get() with the wrong type") {
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{});
    expect_throws_with(ParseError, "type mismatch", static_cast<void>(parser.get<double>("runs")));
}

TEST_CASE("duplicate registration") {
    ArgParser parser("prog");
    parser.add<int>("x");
    expect_throws(ParseError, parser.add<int>("x"));
}

TEST_CASE("argparser_parse reports failure instead of throwing") {
    auto parser = make_parser();
    const char* argv[] = {"prog", "--bogus"};
    std::ostringstream discard;
    auto* old = std::cerr.rdbuf(discard.rdbuf());
    bool ok = rangebench::cli::argparser_parse(parser, 2, argv);
    std::cerr.rdbuf(old);
    expect(ok).to_be_false();
    expect(discard.str()).to_contain("unknown argument: --bogus");
}

// ─────────────────────────────────────────────────────────────────────────────
// TOML config
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("toml config")

TEST_CASE("file values override defaults and CLI overrides the file") {
    auto path = write_toml("rangebench_argparser_test.toml",
                           "# run settings\n"
                           "[run]\n"
                           "runs = 16\n"
                           "seconds = 0.25   # short\n"
                           "name = 'with # hash'\n"
                           "verbose = true\n");
    auto parser = make_parser();
    parser.parse(std::vector<std::string>{"--config", path.string(), "-r", "4"});
    fs::remove(path);
    expect(parser.get<int>("runs")).to_equal(4);
    expect(parser.get<double>("seconds")).to_equal(0.25);
    expect(parser.get<std::string>("name")).to_equal(std::string("with # hash"));
    expect(parser.get<bool>("verbose")).to_be_true();
}

TEST_CASE("file values are range-checked") {
    auto path = write_toml("rangebench_argparser_range.toml", "runs = 0\n");
    auto parser = make_parser();
    std::string message;
    try {
        parser.parse(std::vector<std::string>{"-C", path.string()});
    } catch (const ParseError& e) {
        message = e.what();
    }
    fs::remove(path);
    expect(message).to_contain("below minimum");
}

TEST_CASE("malformed line names file and line") {
    auto path = write_toml("rangebench_argparser_bad.toml", "runs = 2\nseconds 3\n");
    auto parser = make_parser();
    std::string message;
    try {
        parser.parse(std::vector<std::string>{"--config", path.string()});
    } catch (const ParseError& e) {
        message = e.what();
    }
    fs::remove(path);
    expect(message).to_contain(":2: expected key = value");
}

TEST_CASE("duplicate key in file") {
    auto path = write_toml("rangebench_argparser_dup.toml", "runs = 2\nruns = 3\n");
    auto parser = make_parser();
    std::string message;
    try {
        parser.parse(std::vector<std::string>{"--config", path.string()});
    } catch (const ParseError& e) {
        message = e.what();
    }
    fs::remove(path);
    expect(message).to_contain("duplicate key: runs");
}

TEST_CASE("missing file and missing path") {
    auto parser = make_parser();
    expect_throws_with(ParseError, "cannot open", parser.parse(std::vector<std::string>{"--config", "/nonexistent/rangebench.toml"}));
    expect_throws_with(ParseError, "requires a file path", parser.parse(std::vector<std::string>{"--config"}));
}
