/*  csv_table.cpp  ------------------------------------------- */
#include <algorithm>
#include <fstream>
#include <sstream>
#include <iostream>
#include <stdexcept>

#include "csv_table.hpp"
#include "common.hpp"

namespace {

const std::string EMPTY_CELL;

/* split one CSV record; "" inside a quoted field is a literal quote */
std::vector<std::string> split_record(const std::string& line)
{
    std::vector<std::string> out;
    std::string cur;
    bool quoted = false;

    for (size_t i = 0; i < line.size(); ++i) {
        char c = line[i];
        if (quoted) {
            if (c == '"') {
                if (i + 1 < line.size() && line[i + 1] == '"') { cur += '"'; ++i; }
                else quoted = false;
            } else cur += c;
        }
        else if (c == '"') quoted = true;
        else if (c == ',') { out.push_back(cur); cur.clear(); }
        else cur += c;
    }
    out.push_back(cur);
    return out;
}

bool is_blank(const std::string& s)
{
    return trim(s).empty();
}

/* odd number of quotes → a quoted field runs on into the next line */
bool quote_open(const std::string& s)
{
    return std::count(s.begin(), s.end(), '"') % 2 != 0;
}

} // namespace


int Table::col(const std::string& name) const
{
    for (size_t i = 0; i < columns.size(); ++i)
        if (columns[i] == name) return static_cast<int>(i);
    return -1;
}

const std::string& Table::cell(size_t r, int c) const
{
    if (c < 0 || r >= rows.size()) return EMPTY_CELL;
    const auto& row = rows[r];
    return size_t(c) < row.size() ? row[c] : EMPTY_CELL;
}


Table parse_csv_text(const std::string& text)
{
    Table t;
    std::istringstream in(text);
    std::string line;
    bool header = true;

    while (std::getline(in, line)) {
        if (header && line.compare(0, 3, "\xEF\xBB\xBF") == 0)   // UTF-8 BOM
            line.erase(0, 3);
        if (!line.empty() && line.back() == '\r') line.pop_back();
        if (is_blank(line)) continue;

        std::string next;
        while (quote_open(line) && std::getline(in, next)) {
            if (!next.empty() && next.back() == '\r') next.pop_back();
            line += '\n';
            line += next;
        }

        auto rec = split_record(line);
        if (header) {
            for (auto& name : rec) name = trim(name);
            t.columns = std::move(rec);
            header = false;
        } else {
            t.rows.push_back(std::move(rec));
        }
    }
    return t;
}

Table load_csv_table(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    if (!f) throw std::runtime_error("Cannot read " + path);

    std::ostringstream ss;
    ss << f.rdbuf();
    return parse_csv_text(ss.str());
}


void print_table_summary(const Table& t, size_t head)
{
    std::cout << "Raw dataset shape: (" << t.n_rows() << ", " << t.n_cols() << ")\n"
              << "Columns: [" << join(t.columns) << "]\n";

    if (!head || t.rows.empty()) return;
    std::cout << "\nFirst few rows:\n" << join(t.columns, " | ") << '\n';
    for (size_t r = 0; r < std::min(head, t.n_rows()); ++r) {
        std::vector<std::string> cells;
        for (size_t c = 0; c < t.n_cols(); ++c) cells.push_back(t.cell(r, int(c)));
        std::cout << join(cells, " | ") << '\n';
    }
}
