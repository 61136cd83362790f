#include "csv/grid_reader.hpp"
#include <catch2/catch_test_macros.hpp>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <string_view>
#include <vector>

using namespace histeq;
namespace fs = std::filesystem;

namespace {

fs::path write_temp(const std::string& name, const std::string& text) {
    const fs::path p = fs::temp_directory_path() / name;
    std::ofstream f(p, std::ios::binary);
    f << text;
    return p;
}

}

TEST_CASE("parse_csv_grid: rows and columns", "[csv]")
{
    const auto g = parse_csv_grid("1,2,3\n4,5,6\n", csv_dialect{});

    CHECK(g.rows == 2);
    CHECK(g.cols == 3);
    CHECK(g.at(1, 2) == "6");
    CHECK(g.header.empty());
}

TEST_CASE("parse_csv_grid: header, CRLF, blank lines and padding", "[csv]")
{
    csv_dialect d;
    d.has_header = true;
    const auto g = parse_csv_grid("a, b\r\n\r\n 1 ,2\r\n3,4", d);

    CHECK(g.header == std::vector<std::string>{"a", "b"});
    CHECK(g.rows == 2);
    CHECK(g.cells == std::vector<std::string>{"1", "2", "3", "4"});
}

TEST_CASE("parse_csv_grid: quoted fields keep delimiters and escaped quotes", "[csv]")
{
    const auto g = parse_csv_grid("\"x \"\"y\"\"\",\" 2;3 \"\n", csv_dialect{});

    REQUIRE(g.cols == 2);
    CHECK(g.at(0, 0) == "x \"y\"");
    CHECK(g.at(0, 1) == " 2;3 ");
}

TEST_CASE("parse_csv_grid: custom delimiter", "[csv]")
{
    csv_dialect d;
    d.delimiter = ';';
    const auto g = parse_csv_grid("1;2\n3;4\n", d);
    CHECK(g.cols == 2);
    CHECK(g.at(1, 0) == "3");
}

TEST_CASE("grid_parser: pieces may split anywhere", "[csv]")
{
    const std::string text = "\"1\"\"0\",2\r\n3,\"4\"\r\n";
    for (std::size_t cut = 0; cut <= text.size(); ++cut) {
        grid_parser p(csv_dialect{});
        p.feed(std::string_view(text).substr(0, cut));
        p.feed(std::string_view(text).substr(cut));
        const auto g = p.finish();
        REQUIRE(g.rows == 2);
        CHECK(g.cells == std::vector<std::string>{"1\"0", "2", "3", "4"});
        CHECK(g.bytes == text.size());
    }
}

TEST_CASE("parse_csv_grid: malformed records are rejected", "[csv][errors]")
{
    CHECK_THROWS_AS(parse_csv_grid("1,2\n3\n", csv_dialect{}), std::runtime_error);
    CHECK_THROWS_AS(parse_csv_grid("1,\"2\n", csv_dialect{}), std::runtime_error);
}

TEST_CASE("read_csv_grid: reads a file in small chunks", "[csv][io]")
{
    const auto p = write_temp("histeq_grid_reader_test.csv", "10,20\n30,40\n50,60\n");
    const auto g = read_csv_grid(p, csv_dialect{}, 3);

    CHECK(g.rows == 3);
    CHECK(g.cols == 2);
    CHECK(g.at(2, 1) == "60");
    CHECK(g.bytes == file_size_bytes(p));
    fs::remove(p);
}

TEST_CASE("read_csv_grid: missing and empty files fail", "[csv][io][errors]")
{
    CHECK_THROWS_AS(read_csv_grid(fs::temp_directory_path() / "histeq_no_such_file.csv", csv_dialect{}),
                    std::runtime_error);

    const auto p = write_temp("histeq_grid_reader_empty.csv", "\n\n");
    CHECK_THROWS_AS(read_csv_grid(p, csv_dialect{}), std::runtime_error);
    fs::remove(p);

    CHECK_THROWS_AS(chunk_reader(p, 0), std::invalid_argument);
}
