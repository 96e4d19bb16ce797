#include <sstream>
#include <string>

#include "../testing/test_main.hpp"
#include "csv_reporter.hxx"

using rangebench::CollectingReporter;
using rangebench::CsvReporter;
using rangebench::RunResult;

namespace {

auto result(std::string name, std::uint64_t mean) -> RunResult {
    return RunResult{.qualified_name = std::move(name), .mean_ns = mean, .run_count = 8, .total_ns = mean * 8};
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// CsvReporter
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("csv reporter")

TEST_CASE("nothing is written before the first row") {
    std::ostringstream out;
    CsvReporter reporter(out);
    expect(out.str().empty()).to_be_true();
}

TEST_CASE("header precedes the first row") {
    std::ostringstream out;
    CsvReporter reporter(out);
    reporter.report(result("range_bench/pop/1024", 103674));
    expect(out.str()).to_equal(std::string("Name,Time (ns)\nrange_bench/pop/1024,103674\n"));
}

TEST_CASE("header is written exactly once") {
    std::ostringstream out;
    CsvReporter reporter(out);
    reporter.report(result("e/b/1", 10));
    reporter.report(result("e/b/2", 20));
    reporter.finish();
    expect(out.str()).to_equal(std::string("Name,Time (ns)\ne/b/1,10\ne/b/2,20\n"));
    expect(reporter.rows()).to_equal(std::size_t{2});
}

TEST_CASE("rows keep production order") {
    std::ostringstream out;
    CsvReporter reporter(out);
    reporter.report(result("z/b/1", 1));
    reporter.report(result("a/b/1", 2));
    expect(out.str()).to_equal(std::string("Name,Time (ns)\nz/b/1,1\na/b/1,2\n"));
}

TEST_CASE("a run with no rows still yields the header") {
    std::ostringstream out;
    CsvReporter reporter(out);
    reporter.finish();
    reporter.finish();
    expect(out.str()).to_equal(std::string("Name,Time (ns)\n"));
}

TEST_CASE("each row is visible as soon as it is reported") {
    std::stringstream out;
    CsvReporter reporter(out);
    reporter.report(result("e/b/1", 5));
    std::string header;
    std::string row;
    std::getline(out, header);
    std::getline(out, row);
    expect(row).to_equal(std::string("e/b/1,5"));
}

TEST_CASE("mean of zero is printed as 0") {
    std::ostringstream out;
    CsvReporter reporter(out);
    reporter.report(result("e/noop/1", 0));
    expect(out.str()).to_contain("e/noop/1,0\n");
}

// ─────────────────────────────────────────────────────────────────────────────
// CollectingReporter
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("collecting reporter")

TEST_CASE("keeps every field of every result") {
    CollectingReporter reporter;
    reporter.report(result("e/b/1", 7));
    expect(reporter.results().size()).to_equal(std::size_t{1});
    expect(reporter.results()[0]).to_equal(RunResult{.qualified_name = "e/b/1", .mean_ns = 7, .run_count = 8, .total_ns = 56});
    expect(reporter.finished()).to_be_false();
    reporter.finish();
    expect(reporter.finished()).to_be_true();
}
