/* ──────────────────────────────────────────────────────────────
   cycle_features.hpp  –  per-person sliding windows & assembly
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <string>
#include <vector>

#include "common.hpp"
#include "csv_table.hpp"

/* FedCycle column names */
constexpr char COL_CYCLE_LEN [] = "LengthofCycle";
constexpr char COL_MENSES_LEN[] = "LengthofMenses";
constexpr char COL_CYCLE_NUM [] = "CycleNumber";
constexpr char COL_AGE       [] = "Age";
constexpr char COL_BMI       [] = "BMI";

/* cycle_1..cycle_W, mean, std, min, max, period_length, age, bmi */
std::vector<std::string> feature_names(int seq_len = SEQ_LEN);

/*  One person's rows (table row indices, chronological) → samples.
    Returns nothing if fewer than seq_len+1 valid cycle lengths.      */
std::vector<Sample> build_person_samples(const Table&               t,
                                         const std::vector<size_t>& rows,
                                         int                        seq_len = SEQ_LEN,
                                         const std::string&         person = "");

/* "" if no identifier column can be found */
std::string find_id_column(const Table& t);

/*  Group by identifier (first-appearance order), re-sort each group by
    CycleNumber when present, concatenate every person's samples.     */
std::vector<Sample> prepare_dataset(const Table& t, int seq_len = SEQ_LEN);

void print_dataset_summary(const std::vector<Sample>& DS);
