/* ──────────────────────────────────────────────────────────────
   csv_table.hpp   –  comma-delimited dataset loader
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

/* raw cells only – numeric coercion happens where a column is used */
struct Table {
    std::vector<std::string>              columns;
    std::vector<std::vector<std::string>> rows;

    size_t n_rows() const { return rows.size();    }
    size_t n_cols() const { return columns.size(); }

    int  col    (const std::string& name) const;   // -1 if absent
    bool has_col(const std::string& name) const { return col(name) >= 0; }

    /* cell(r, c) – rows shorter than the header read as "" */
    const std::string& cell(size_t r, int c) const;
};

/* throws std::runtime_error if `path` cannot be opened */
Table load_csv_table(const std::string& path);

/* same parser, in-memory text (UTF-8, optional BOM); a quoted field
   may span lines, an unterminated quote runs to the end of the text */
Table parse_csv_text(const std::string& text);

/* shape, column list and the first `head` rows → stdout */
void print_table_summary(const Table& t, size_t head = 5);
