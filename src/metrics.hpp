#pragma once
#include "model_iface.hpp"

struct RegressionMetrics {
    double mae           = 0;
    double mse           = 0;
    double rmse          = 0;
    double within_1_day  = 0;     // % of |ŷ-y| ≤ 1
    double within_2_days = 0;
    double within_3_days = 0;

    ojson to_json() const;
};

RegressionMetrics evaluate_regression(const Vec& y_true, const Vec& y_pred);

/* "TEST SET RESULTS" block → stdout */
void report_metrics(const RegressionMetrics& m, const std::string& title = "TEST SET RESULTS");
