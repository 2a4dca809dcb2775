/*  cycle_features.cpp  -------------------------------------- */
#include <algorithm>
#include <cmath>
#include <numeric>
#include <iostream>
#include <iomanip>
#include <iterator>
#include <unordered_map>

#include "cycle_features.hpp"

namespace {

/* numeric cells of column c in row order, non-numbers dropped */
std::vector<double> numeric_column(const Table& t,
                                   const std::vector<size_t>& rows,
                                   int c)
{
    std::vector<double> out;
    if (c < 0) return out;
    out.reserve(rows.size());
    for (size_t r : rows) {
        double v = to_number(t.cell(r, c));
        if (!std::isnan(v)) out.push_back(v);
    }
    return out;
}

/* value of column `name` on the person's first row, or `dflt` */
double first_row_value(const Table& t, const std::vector<size_t>& rows,
                       const char* name, double dflt)
{
    int c = t.col(name);
    if (c < 0 || rows.empty()) return dflt;
    double v = to_number(t.cell(rows.front(), c));
    return std::isnan(v) ? dflt : v;
}

inline bool in_cycle_range(double v) { return v >= CYCLE_MIN && v <= CYCLE_MAX; }

} // namespace


std::vector<std::string> feature_names(int seq_len)
{
    std::vector<std::string> names;
    for (int i = 1; i <= seq_len; ++i) names.push_back("cycle_" + std::to_string(i));
    for (const char* n : {"mean", "std", "min", "max", "period_length", "age", "bmi"})
        names.emplace_back(n);
    return names;
}


std::vector<Sample> build_person_samples(const Table&               t,
                                         const std::vector<size_t>& rows,
                                         int                        seq_len,
                                         const std::string&         person)
{
    std::vector<Sample> out;
    if (seq_len <= 0) return out;

    const std::vector<double> cycles = numeric_column(t, rows, t.col(COL_CYCLE_LEN));
    const size_t W = static_cast<size_t>(seq_len);
    if (cycles.size() < W + 1) return out;

    /* menses list is compacted on its own – offsets line up with table rows
       only when both columns are complete                                  */
    const bool has_menses = t.has_col(COL_MENSES_LEN);
    const std::vector<double> menses =
        numeric_column(t, rows, t.col(COL_MENSES_LEN));

    const double age = first_row_value(t, rows, COL_AGE, DEFAULT_AGE);
    const double bmi = first_row_value(t, rows, COL_BMI, DEFAULT_BMI);

    for (size_t i = 0; i + W < cycles.size(); ++i) {
        const double target = cycles[i + W];
        if (!in_cycle_range(target)) continue;
        if (!std::all_of(cycles.begin() + i, cycles.begin() + i + W, in_cycle_range))
            continue;

        Sample s;
        s.target = target;
        s.person = person;
        s.feat.assign(cycles.begin() + i, cycles.begin() + i + W);

        const double mean = std::accumulate(s.feat.begin(), s.feat.end(), 0.0) / W;
        double var = 0.0;
        for (size_t k = 0; k < W; ++k) var += (s.feat[k] - mean) * (s.feat[k] - mean);
        const auto mm = std::minmax_element(s.feat.begin(), s.feat.begin() + W);

        s.feat.push_back(mean);
        s.feat.push_back(std::sqrt(var / W));      // population std (ddof = 0)
        s.feat.push_back(*mm.first);
        s.feat.push_back(*mm.second);

        double period = DEFAULT_PERIOD;
        if (has_menses && menses.size() > i + W) {
            double sum = 0.0; int cnt = 0;
            for (size_t k = i; k < i + W; ++k)
                if (menses[k] > PERIOD_MIN_EXCL && menses[k] < PERIOD_MAX_EXCL) {
                    sum += menses[k]; ++cnt;
                }
            if (cnt) period = sum / cnt;
        }
        s.feat.push_back(period);
        s.feat.push_back(age);
        s.feat.push_back(bmi);

        out.push_back(std::move(s));
    }
    return out;
}


std::string find_id_column(const Table& t)
{
    for (const char* c : {"ClientID", "ID", "Client", "Person", "Subject"})
        if (t.has_col(c)) return c;

    for (const auto& c : t.columns) {
        const std::string lc = to_lower(c);
        if (lc.find("id") != std::string::npos || lc.find("client") != std::string::npos)
            return c;
    }
    return "";
}


std::vector<Sample> prepare_dataset(const Table& t, int seq_len)
{
    std::vector<Sample> DS;

    const std::string id_col = find_id_column(t);
    if (id_col.empty()) {
        logW("No ID column found. Treating entire dataset as one person.");
        std::vector<size_t> all(t.n_rows());
        std::iota(all.begin(), all.end(), size_t(0));
        return build_person_samples(t, all, seq_len, "");
    }
    std::cout << "Using '" << id_col << "' as person identifier\n";

    /* ---- group rows, keep first-appearance order ---------------- */
    const int c_id = t.col(id_col);
    std::vector<std::string>                    order;
    std::unordered_map<std::string, std::vector<size_t>> groups;
    size_t blank_ids = 0;

    for (size_t r = 0; r < t.n_rows(); ++r) {
        const std::string key = trim(t.cell(r, c_id));
        if (key.empty()) { ++blank_ids; continue; }    // NaN id 不属于任何人
        auto it = groups.find(key);
        if (it == groups.end()) {
            order.push_back(key);
            groups.emplace(key, std::vector<size_t>{r});
        } else {
            it->second.push_back(r);
        }
    }
    std::cout << "Found " << order.size() << " unique persons\n";
    if (blank_ids) logW(std::to_string(blank_ids) + " rows without " + id_col + " skipped");

    /* ---- per person --------------------------------------------- */
    const int c_num = t.col(COL_CYCLE_NUM);
    for (const auto& key : order) {
        std::vector<size_t>& rows = groups[key];

        if (c_num >= 0) {
            std::stable_sort(rows.begin(), rows.end(), [&](size_t a, size_t b) {
                double x = to_number(t.cell(a, c_num));
                double y = to_number(t.cell(b, c_num));
                if (std::isnan(x)) return false;          // NaN last
                if (std::isnan(y)) return true;
                return x < y;
            });
        }

        auto S = build_person_samples(t, rows, seq_len, key);
        if (S.empty()) continue;
        DS.insert(DS.end(), std::make_move_iterator(S.begin()),
                            std::make_move_iterator(S.end()));
    }
    return DS;
}


void print_dataset_summary(const std::vector<Sample>& DS)
{
    if (DS.empty()) return;

    double lo = DS.front().target, hi = lo, sum = 0.0;
    for (const auto& s : DS) {
        lo = std::min(lo, s.target);
        hi = std::max(hi, s.target);
        sum += s.target;
    }
    std::cout << "Total samples: "       << DS.size()              << '\n'
              << "Feature vector size: " << DS.front().feat.size() << '\n'
              << std::fixed << std::setprecision(0)
              << "Target range: " << lo << " - " << hi << " days\n"
              << std::setprecision(1)
              << "Target mean: "  << sum / DS.size() << " days\n";
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}
