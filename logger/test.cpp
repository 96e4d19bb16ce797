#include <algorithm>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>
#include <string>

#include "../testing/test_main.hpp"
#include "logger.hxx"

using rangebench::Logger;
namespace fs = std::filesystem;

namespace {

// The logger is a process-wide singleton; every test starts from the same
// uncolored, WARNING-level state writing into a fresh buffer.
auto capture(Logger::level lvl = Logger::level::WARNING) -> std::ostringstream& {
    static std::ostringstream sink;
    sink.str("");
    auto& log = Logger::get_instance();
    log.set_sink(sink);
    log.set_colors(false);
    log.set_min_level(lvl);
    return sink;
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Levels
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("log levels")

TEST_CASE("parse_level accepts the documented names") {
    expect(Logger::parse_level("debug") == Logger::level::DEBUG).to_be_true();
    expect(Logger::parse_level("info") == Logger::level::INFO).to_be_true();
    expect(Logger::parse_level("warning") == Logger::level::WARNING).to_be_true();
    expect(Logger::parse_level("warn") == Logger::level::WARNING).to_be_true();
    expect(Logger::parse_level("error") == Logger::level::ERROR).to_be_true();
}

TEST_CASE("parse_level rejects anything else") {
    expect_throws(std::invalid_argument, static_cast<void>(Logger::parse_level("DEBUG")));
    expect_throws(std::invalid_argument, static_cast<void>(Logger::parse_level("")));
}

TEST_CASE("messages below the minimum level are dropped") {
    auto& out = capture(Logger::level::WARNING);
    RB_LOG_DEBUG << "hidden debug";
    RB_LOG_INFO << "hidden info";
    RB_LOG_WARN << "shown warning";
    expect(out.str()).not_to_contain("hidden");
    expect(out.str()).to_contain("shown warning");
}

TEST_CASE("lowering the level lets debug through") {
    auto& out = capture(Logger::level::DEBUG);
    RB_LOG_DEBUG << "now visible";
    expect(out.str()).to_contain("[ DEBUG ] now visible");
    expect(Logger::get_instance().min_level() == Logger::level::DEBUG).to_be_true();
}

TEST_CASE("enabled() follows the minimum level") {
    capture(Logger::level::WARNING);
    auto& log = Logger::get_instance();
    expect(log.enabled(Logger::level::DEBUG)).to_be_false();
    expect(log.enabled(Logger::level::WARNING)).to_be_true();
    expect(log.enabled(Logger::level::ERROR)).to_be_true();
    log.set_min_level(Logger::level::DEBUG);
    expect(log.enabled(Logger::level::DEBUG)).to_be_true();
    log.set_min_level(Logger::level::WARNING);
}

TEST_CASE("error messages are logged without terminating") {
    auto& out = capture();
    RB_LOG_ERROR << "recoverable";
    expect(out.str()).to_contain("[ ERROR ] recoverable");
}

// ─────────────────────────────────────────────────────────────────────────────
// Formatting
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("log formatting")

TEST_CASE("stream tokens are concatenated into one line") {
    auto& out = capture();
    RB_LOG_WARN << "entry " << std::string("e") << " has " << 3 << " sizes";
    std::string text = out.str();
    expect(text).to_contain("entry e has 3 sizes\n");
    expect(static_cast<int>(std::count(text.begin(), text.end(), '\n'))).to_equal(1);
}

TEST_CASE("every line carries an elapsed-time tag") {
    auto& out = capture();
    Logger::get_instance().warning("plain");
    expect(out.str().substr(0, 1)).to_equal(std::string("["));
    expect(out.str()).to_contain("] [WARNING] plain");
}

TEST_CASE("an empty stream emits nothing") {
    auto& out = capture();
    { auto stream = Logger::get_instance().error(); }
    expect(out.str().empty()).to_be_true();
}

TEST_CASE("RB_LOG_HERE prefixes the source location") {
    auto& out = capture(Logger::level::DEBUG);
    RB_LOG_HERE << "here";
    expect(out.str()).to_contain("test.cpp:");
    expect(out.str()).to_contain("| here");
}

TEST_CASE("colors wrap the level tag in ANSI codes when enabled") {
    auto& out = capture();
    Logger::get_instance().set_colors(true);
    RB_LOG_WARN << "tinted";
    Logger::get_instance().set_colors(false);
    expect(out.str()).to_contain("\033[");
}

// ─────────────────────────────────────────────────────────────────────────────
// Initialization
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("log initialization")

TEST_CASE("initialize() mirrors lines into a file, and only once") {
    auto path = fs::temp_directory_path() / "rangebench_logger_test.log";
    fs::remove(path);
    auto& out = capture();
    auto& log = Logger::get_instance();
    log.initialize(Logger::level::INFO, path.string(), false);
    RB_LOG_INFO << "to both";
    log.flush();

    expect_throws(std::runtime_error, log.initialize());

    std::ifstream file(path);
    std::stringstream contents;
    contents << file.rdbuf();
    expect(contents.str()).to_contain("[  INFO ] to both");
    expect(out.str()).to_contain("to both");
    fs::remove(path);
}
