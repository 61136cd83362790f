#pragma once
#include <cstddef>
#include <cstdint>
#include <filesystem>
#include <stdexcept>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

#include "../io/chunk_reader.hpp"

namespace histeq {

struct csv_dialect {
    char delimiter = ',';
    char quote = '"';
    bool has_header = false;
};

// Rectangular table of cells, row-major, header excluded.
struct csv_grid {
    std::vector<std::string> header;
    std::vector<std::string> cells;
    std::size_t rows = 0;
    std::size_t cols = 0;
    std::uint64_t bytes = 0;

    const std::string& at(std::size_t r, std::size_t c) const { return cells[r * cols + c]; }
};

inline std::string trim_cell(std::string_view s) {
    std::size_t b = 0, e = s.size();
    while (b < e && (s[b] == ' ' || s[b] == '\t')) ++b;
    while (e > b && (s[e - 1] == ' ' || s[e - 1] == '\t')) --e;
    return std::string(s.substr(b, e - b));
}

/**
 * Incremental RFC4180-style parser. Text may be fed in arbitrary pieces;
 * quoted fields, escaped quotes ("") and CRLF may straddle piece boundaries.
 * Blank lines are skipped. Every record must have as many fields as the first.
 */
class grid_parser {
public:
    explicit grid_parser(csv_dialect d) : d_(d) {}

    void feed(std::string_view text) {
        for (char c : text) feed_char(c);
        grid_.bytes += text.size();
    }

    csv_grid finish() {
        if (quote_pending_) {
            quote_pending_ = false;
            in_quotes_ = false;
        }
        if (in_quotes_)
            throw std::runtime_error("unterminated quoted field in record " +
                                     std::to_string(record_ + 1));
        if (!field_.empty() || !row_.empty() || field_quoted_) end_row();
        return std::move(grid_);
    }

private:
    void feed_char(char c) {
        if (skip_lf_) {
            skip_lf_ = false;
            if (c == '\n') return;
        }
        if (quote_pending_) {
            quote_pending_ = false;
            if (c == d_.quote) { field_.push_back(c); return; }
            in_quotes_ = false;
        }
        if (in_quotes_) {
            if (c == d_.quote) quote_pending_ = true;
            else field_.push_back(c);
            return;
        }
        if (c == d_.quote) {
            in_quotes_ = true;
            field_quoted_ = true;
        } else if (c == d_.delimiter) {
            end_field();
        } else if (c == '\r') {
            end_row();
            skip_lf_ = true;
        } else if (c == '\n') {
            end_row();
        } else {
            field_.push_back(c);
        }
    }

    void end_field() {
        row_.push_back(field_quoted_ ? field_ : trim_cell(field_));
        field_.clear();
        field_quoted_ = false;
    }

    void end_row() {
        const bool blank = row_.empty() && field_.empty() && !field_quoted_;
        end_field();
        if (blank) {
            row_.clear();
            return;
        }
        ++record_;

        if (d_.has_header && !header_done_) {
            header_done_ = true;
            grid_.header = std::move(row_);
            row_.clear();
            return;
        }
        if (grid_.rows == 0) {
            grid_.cols = row_.size();
        } else if (row_.size() != grid_.cols) {
            throw std::runtime_error("record " + std::to_string(record_) + " has " +
                                     std::to_string(row_.size()) + " fields, expected " +
                                     std::to_string(grid_.cols));
        }
        for (auto& f : row_) grid_.cells.push_back(std::move(f));
        row_.clear();
        ++grid_.rows;
    }

    csv_dialect d_;
    csv_grid grid_;
    std::vector<std::string> row_;
    std::string field_;
    std::size_t record_ = 0;
    bool in_quotes_ = false;
    bool quote_pending_ = false;
    bool field_quoted_ = false;
    bool skip_lf_ = false;
    bool header_done_ = false;
};

inline csv_grid parse_csv_grid(std::string_view text, const csv_dialect& d) {
    grid_parser p(d);
    p.feed(text);
    return p.finish();
}

inline csv_grid read_csv_grid(const std::filesystem::path& path, const csv_dialect& d,
                              std::size_t chunk_bytes = 262144)
{
    chunk_reader reader(path, chunk_bytes);
    grid_parser p(d);
    for (std::string_view chunk = reader.next(); !chunk.empty(); chunk = reader.next()) {
        p.feed(chunk);
    }
    csv_grid g = p.finish();
    if (g.rows == 0) throw std::runtime_error("no data rows in " + path.string());
    return g;
}

}
