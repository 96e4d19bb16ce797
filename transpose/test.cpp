#include <sstream>
#include <string>
#include <vector>

#include "../reporting/csv_reporter.hxx"
#include "../testing/test_main.hpp"
#include "transpose.hxx"

using rangebench::parse_row;
using rangebench::Transposer;
using rangebench::TransposeError;

namespace {

auto run_transpose(const std::string& input) -> std::string {
    std::istringstream in(input);
    std::ostringstream out;
    rangebench::transpose(in, out);
    return out.str();
}

}  // namespace

// ─────────────────────────────────────────────────────────────────────────────
// Line parsing
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("row parsing")

TEST_CASE("family is the name minus the trailing size") {
    auto row = parse_row("range_bench/pop/1024,103674", 1);
    expect(row.has_value()).to_be_true();
    expect(row->family).to_equal(std::string("range_bench/pop"));
    expect(row->size).to_equal(std::uint64_t{1024});
    expect(row->time_ns).to_equal(std::uint64_t{103674});
}

TEST_CASE("header and blank lines are skipped") {
    expect(parse_row("Name,Time (ns)", 1).has_value()).to_be_false();
    expect(parse_row("", 2).has_value()).to_be_false();
}

TEST_CASE("a trailing carriage return is tolerated") {
    auto row = parse_row("a/b/2,9\r", 1);
    expect(row->time_ns).to_equal(std::uint64_t{9});
    expect(parse_row("Name,Time (ns)\r", 1).has_value()).to_be_false();
}

TEST_CASE("missing comma is rejected") { expect_throws_with(TransposeError, "two comma-separated", parse_row("a/b/1 100", 1)); }

TEST_CASE("extra field is rejected") { expect_throws(TransposeError, parse_row("a/b/1,100,7", 1)); }

TEST_CASE("name without a size suffix is rejected") { expect_throws(TransposeError, parse_row("ab,100", 1)); }

TEST_CASE("name with only two segments is rejected") { expect_throws_with(TransposeError, "entry/body/size", parse_row("a/1,100", 1)); }

TEST_CASE("a name whose middle segment ends in a slash is accepted") {
    auto row = parse_row("a/b//10,5", 1);
    expect(row.has_value()).to_be_true();
    expect(row->family).to_equal(std::string("a/b/"));
    expect(row->size).to_equal(std::uint64_t{10});
}

TEST_CASE("extra slashes stay in the family") {
    auto row = parse_row("a/b/c/10,5", 1);
    expect(row.has_value()).to_be_true();
    expect(row->family).to_equal(std::string("a/b/c"));
}

TEST_CASE("an empty entry or body segment is rejected") {
    expect_throws_with(TransposeError, "entry/body/size", parse_row("a//10,5", 1));
    expect_throws_with(TransposeError, "entry/body/size", parse_row("/b/10,5", 1));
}

TEST_CASE("non-numeric size is rejected") { expect_throws_with(TransposeError, "size 'x'", parse_row("a/b/x,100", 1)); }

TEST_CASE("non-numeric or negative time is rejected") {
    expect_throws_with(TransposeError, "time", parse_row("a/b/1,fast", 1));
    expect_throws(TransposeError, parse_row("a/b/1,-5", 1));
    expect_throws(TransposeError, parse_row("a/b/1,", 1));
}

TEST_CASE("errors carry the line number and text") {
    try {
        static_cast<void>(parse_row("garbage", 42));
    } catch (const TransposeError& e) {
        expect(e.line).to_equal(std::size_t{42});
        expect(e.text).to_equal(std::string("garbage"));
        expect(std::string(e.what())).to_contain("line 42");
        return;
    }
    throw std::runtime_error("no TransposeError thrown");
}

// ─────────────────────────────────────────────────────────────────────────────
// Pivoting
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("pivoting")

TEST_CASE("two families at one size become one row") {
    expect(run_transpose("Name,Time (ns)\nfoo/bar/10,100\nbaz/qux/10,200\n")).to_equal(std::string("Size,foo/bar,baz/qux\n10,100,200\n"));
}

TEST_CASE("families keep first-seen order and sizes are ascending") {
    std::string input =
        "Name,Time (ns)\n"
        "range_bench/pop/4096,400\n"
        "range_bench/pop/1024,100\n"
        "gen_bench/pop/1024,110\n"
        "gen_bench/pop/4096,410\n";
    expect(run_transpose(input)).to_equal(std::string("Size,range_bench/pop,gen_bench/pop\n1024,100,110\n4096,400,410\n"));
}

TEST_CASE("a missing (family, size) pair leaves an empty cell") {
    std::string input =
        "a/x/1,5\n"
        "a/x/2,6\n"
        "a/y/2,7\n";
    expect(run_transpose(input)).to_equal(std::string("Size,a/x,a/y\n1,5,\n2,6,7\n"));
}

TEST_CASE("input without a header is accepted") { expect(run_transpose("a/b/3,30\n")).to_equal(std::string("Size,a/b\n3,30\n")); }

TEST_CASE("concatenated runs with repeated headers are accepted") {
    std::string input =
        "Name,Time (ns)\n"
        "a/b/1,10\n"
        "Name,Time (ns)\n"
        "c/d/1,20\n";
    expect(run_transpose(input)).to_equal(std::string("Size,a/b,c/d\n1,10,20\n"));
}

TEST_CASE("empty input yields only the header row") { expect(run_transpose("")).to_equal(std::string("Size\n")); }

TEST_CASE("a duplicate (family, size) pair is an error") {
    expect_throws_with(TransposeError, "line 3", static_cast<void>(run_transpose("Name,Time (ns)\na/b/1,10\na/b/1,11\n")));
}

TEST_CASE("a malformed line reports its 1-based position") {
    expect_throws_with(TransposeError, "line 2", static_cast<void>(run_transpose("a/b/1,10\nnot a row\n")));
}

TEST_CASE("nothing is written when the input is malformed") {
    std::istringstream in("a/b/1,10\nbroken\n");
    std::ostringstream out;
    expect_throws(TransposeError, rangebench::transpose(in, out));
    expect(out.str().empty()).to_be_true();
}

TEST_CASE("echo receives the raw input unchanged") {
    std::string input = "Name,Time (ns)\na/b/1,10\n";
    std::istringstream in(input);
    std::ostringstream out;
    std::ostringstream echo;
    rangebench::transpose(in, out, &echo);
    expect(echo.str()).to_equal(input);
    expect(out.str()).to_equal(std::string("Size,a/b\n1,10\n"));
}

TEST_CASE("Transposer exposes families, sizes and cells") {
    Transposer table;
    table.add_line("e/x/8,80");
    table.add_line("e/y/2,20");
    expect(table.families()).to_equal(std::vector<std::string>{"e/x", "e/y"});
    expect(table.sizes()).to_equal(std::vector<std::uint64_t>{2, 8});
    expect(table.cell("e/x", 8).value_or(0)).to_equal(std::uint64_t{80});
    expect(table.cell("e/x", 2).has_value()).to_be_false();
    expect(table.cell("nope", 8).has_value()).to_be_false();
}

// ─────────────────────────────────────────────────────────────────────────────
// Reporter output round trip
// ─────────────────────────────────────────────────────────────────────────────

TEST_SUITE("reporter round trip")

TEST_CASE("CsvReporter output transposes without loss") {
    std::ostringstream csv;
    rangebench::CsvReporter reporter(csv);
    for (std::uint64_t size : {1, 4, 16}) {
        reporter.report({.qualified_name = "e/fast/" + std::to_string(size), .mean_ns = size});
        reporter.report({.qualified_name = "e/slow/" + std::to_string(size), .mean_ns = size * 100});
    }
    reporter.finish();
    expect(run_transpose(csv.str())).to_equal(std::string("Size,e/fast,e/slow\n1,1,100\n4,4,400\n16,16,1600\n"));
}
