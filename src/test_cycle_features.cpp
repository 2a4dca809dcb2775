#include <cmath>
#include <numeric>
#include <sstream>

#include "cycle_features.hpp"
#include "test_util.hpp"

namespace {

std::vector<size_t> all_rows(const Table& t)
{
    std::vector<size_t> r(t.n_rows());
    std::iota(r.begin(), r.end(), size_t(0));
    return r;
}

/* one column of cycle lengths, optional extra columns */
Table cycles_table(const std::vector<std::string>& lens)
{
    std::ostringstream ss;
    ss << "LengthofCycle\n";
    for (const auto& v : lens) ss << v << '\n';
    return parse_csv_text(ss.str());
}

bool all_finite(const Sample& s)
{
    for (double v : s.feat) if (!std::isfinite(v)) return false;
    return std::isfinite(s.target);
}

} // namespace

int main()
{
    std::cout << "Testing per-person windows & dataset assembly..." << std::endl;

    /* ---- single window, all defaults --------------------------- */
    {
        Table t = cycles_table({"28", "30", "29", "27", "31", "28", "29"});
        auto S = build_person_samples(t, all_rows(t));
        check(S.size() == 1, "7 cycles, W=6 → exactly one sample");
        if (S.size() == 1) {
            const auto& f = S[0].feat;
            const std::vector<double> win{28, 30, 29, 27, 31, 28};
            check(f.size() == size_t(NUM_FEATS), "13 features");
            check(std::equal(win.begin(), win.end(), f.begin()), "window = first six cycles");
            check(S[0].target == 29.0, "target = seventh cycle");

            const double mean = 173.0 / 6.0;
            double var = 0;
            for (double v : win) var += (v - mean) * (v - mean);
            check(near(f[6], mean),                 "mean");
            check(near(f[7], std::sqrt(var / 6.0)), "population std");
            check(f[8] == 27.0 && f[9] == 31.0,     "min / max");
            check(f[10] == DEFAULT_PERIOD,          "period default 5.0");
            check(f[11] == DEFAULT_AGE,             "age default 30.0");
            check(f[12] == DEFAULT_BMI,             "bmi default 22.0");
        }
    }

    /* ---- too short ---------------------------------------------- */
    {
        Table t = cycles_table({"28", "30", "29", "27", "31", "28"});
        check(build_person_samples(t, all_rows(t)).empty(), "6 cycles → no sample");

        Table u = cycles_table({"28", "30", "x", "27", "31", "28", "", "29"});
        check(build_person_samples(u, all_rows(u)).empty(),
              "non-numeric entries dropped, not zeroed (6 valid → none)");
    }

    /* ---- N - W samples, offset by one --------------------------- */
    {
        std::vector<std::string> v;
        for (int i = 0; i < 12; ++i) v.push_back(std::to_string(25 + i));
        Table t = cycles_table(v);
        auto S = build_person_samples(t, all_rows(t));
        check(S.size() == 6, "N=12 → N-6 samples");
        bool shifted = true;
        for (size_t k = 0; k < S.size(); ++k)
            if (S[k].feat[0] != 25.0 + k || S[k].target != 31.0 + k) shifted = false;
        check(shifted, "consecutive samples shift by one cycle");
    }

    /* ---- range filter: skip, never clamp ------------------------ */
    {
        Table t = cycles_table({"28", "30", "29", "14", "31", "28", "29", "30", "61", "28"});
        auto S = build_person_samples(t, all_rows(t));
        bool ok = true;
        for (const auto& s : S) {
            if (s.target < CYCLE_MIN || s.target > CYCLE_MAX) ok = false;
            for (int k = 0; k < SEQ_LEN; ++k)
                if (s.feat[k] < CYCLE_MIN || s.feat[k] > CYCLE_MAX) ok = false;
            if (!all_finite(s)) ok = false;
        }
        check(ok, "kept samples have window and target inside [15, 60]");
        check(S.empty(), "every window touching 14 or 61 is dropped");

        Table b = cycles_table({"15", "60", "15", "60", "15", "60", "15"});
        check(build_person_samples(b, all_rows(b)).size() == 1, "bounds 15 and 60 are inclusive");
    }

    /* ---- menses, age, bmi --------------------------------------- */
    {
        Table t = parse_csv_text(
            "LengthofCycle,LengthofMenses,Age,BMI\n"
            "28,5,35,24.5\n"
            "30,3,,\n"
            "29,20,,\n"
            "27,6,,\n"
            "31,0,,\n"
            "28,4,,\n"
            "29,5,,\n");
        auto S = build_person_samples(t, all_rows(t));
        check(S.size() == 1, "one sample with menses data");
        if (S.size() == 1) {
            check(near(S[0].feat[10], (5.0 + 3 + 6 + 4) / 4.0), "period = mean of values in (0, 15)");
            check(S[0].feat[11] == 35.0 && S[0].feat[12] == 24.5, "age / bmi from first row");
        }

        Table u = parse_csv_text(
            "LengthofCycle,LengthofMenses,Age\n"
            "28,,unknown\n30,,\n29,,\n27,,\n31,,\n28,,\n29,,\n");
        auto U = build_person_samples(u, all_rows(u));
        check(U.size() == 1 && U[0].feat[10] == DEFAULT_PERIOD, "no menses values → 5.0");
        check(U.size() == 1 && U[0].feat[11] == DEFAULT_AGE,    "non-numeric age → 30.0");

        Table w = parse_csv_text(
            "LengthofCycle,LengthofMenses\n"
            "28,20\n30,0\n29,15\n27,16\n31,-1\n28,20\n29,5\n");
        auto W = build_person_samples(w, all_rows(w));
        check(W.size() == 1 && W[0].feat[10] == DEFAULT_PERIOD,
              "all menses outside (0, 15) → 5.0");
    }

    /* ---- partially filled menses column ------------------------- */
    {
        /* 6 valid menses values for 7 cycles: the list is too short for offset 0 */
        Table p = parse_csv_text(
            "LengthofCycle,LengthofMenses\n"
            "28,4\n30,5\n29,\n27,6\n31,4\n28,5\n29,4\n");
        auto P = build_person_samples(p, all_rows(p));
        check(P.size() == 1 && P[0].feat[10] == DEFAULT_PERIOD,
              "7 cycles, 6 menses values → 5.0");

        /* 9 cycles, 8 menses values: offsets 0 and 1 use them, offset 2 does not */
        Table q = parse_csv_text(
            "LengthofCycle,LengthofMenses\n"
            "28,4\n29,5\n30,\n28,6\n27,4\n29,5\n30,4\n28,5\n29,6\n");
        auto Q = build_person_samples(q, all_rows(q));
        check(Q.size() == 3, "9 cycles → 3 samples");
        if (Q.size() == 3) {
            check(near(Q[0].feat[10], 28.0 / 6.0), "offset 0 → mean of compacted menses[0, 6)");
            check(near(Q[1].feat[10], 29.0 / 6.0), "offset 1 → mean of compacted menses[1, 7)");
            check(Q[2].feat[10] == DEFAULT_PERIOD,  "offset 2 → list exhausted, 5.0");
        }
    }

    /* ---- id column detection ------------------------------------ */
    {
        check(find_id_column(parse_csv_text("ClientID,ID\n")) == "ClientID", "preferred name wins");
        check(find_id_column(parse_csv_text("x,Subject\n"))   == "Subject",  "later preferred name");
        check(find_id_column(parse_csv_text("a,PatientIdx\n")) == "PatientIdx", "substring 'id' fallback");
        check(find_id_column(parse_csv_text("a,MyCLIENTS\n")) == "MyCLIENTS", "substring 'client', case-insensitive");
        check(find_id_column(parse_csv_text("LengthofCycle,Age\n")).empty(), "no id column");
    }

    /* ---- assembler ---------------------------------------------- */
    {
        /* B is interleaved and out of order; CycleNumber restores it */
        Table t = parse_csv_text(
            "ClientID,CycleNumber,LengthofCycle,Age\n"
            "A,1,28,abc\nA,2,30,\nA,3,29,\nA,4,27,\nA,5,31,\nA,6,28,\nA,7,29,\n"
            "B,7,35,50\nB,1,30,40\nB,2,31,\nB,3,32,\nB,4,33,\nB,5,34,\nB,6,29,\n"
            "C,1,28,\nC,2,28,\n"
            ",1,28,\n");
        auto DS = prepare_dataset(t);
        check(DS.size() == 2, "A and B contribute one sample each, C is skipped");
        if (DS.size() == 2) {
            check(DS[0].person == "A" && DS[1].person == "B", "first-appearance person order");
            check(DS[0].feat[11] == DEFAULT_AGE, "non-numeric Age on first row → 30.0");
            check(DS[1].feat[0] == 30.0 && DS[1].target == 35.0, "group re-sorted by CycleNumber");
            check(DS[1].feat[11] == 40.0, "age taken from first row after sorting");
        }

        Table single = cycles_table({"28", "30", "29", "27", "31", "28", "29", "30"});
        check(prepare_dataset(single).size() == 2, "no id column → whole table is one person");

        Table none = parse_csv_text("ClientID,LengthofCycle\nA,28\nB,29\n");
        check(prepare_dataset(none).empty(), "no usable person → empty dataset");
    }

    /* ---- feature names ------------------------------------------ */
    {
        auto n = feature_names();
        check(n.size() == size_t(NUM_FEATS), "13 feature names");
        check(n.front() == "cycle_1" && n[5] == "cycle_6" && n[10] == "period_length" &&
              n.back() == "bmi", "feature name order");
    }

    return finish("test_cycle_features");
}
