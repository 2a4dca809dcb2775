/* ──────────────────────────────────────────────────────────────
   trainer.hpp  –  split → standardize → fit → evaluate
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <vector>

#include "model_iface.hpp"
#include "scaler.hpp"
#include "metrics.hpp"

struct DataSplit {
    std::vector<Sample> train, val, test;
};

/*  70 / 15 / 15 row-level split, fixed by `seed`.
    Rows of one person may end up in different parts.               */
DataSplit split_dataset(const std::vector<Sample>& all, unsigned seed);

/* samples → (X, y) */
Mat features_of(const std::vector<Sample>& DS);
Vec targets_of (const std::vector<Sample>& DS);

struct TrainResult {
    std::unique_ptr<IModel> model;
    StandardScaler          scaler;
    RegressionMetrics       test;
    RegressionMetrics       val;
    size_t n_train = 0, n_val = 0, n_test = 0;
};

TrainResult train_pipeline(const std::vector<Sample>& DS, const TrainOpt& opt);
