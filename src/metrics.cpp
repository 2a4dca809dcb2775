#include <cmath>
#include <iostream>
#include <iomanip>
#include <stdexcept>
#include <string>

#include "metrics.hpp"

ojson RegressionMetrics::to_json() const
{
    ojson j;
    j["mae"]           = mae;
    j["mse"]           = mse;
    j["rmse"]          = rmse;
    j["within_1_day"]  = within_1_day;
    j["within_2_days"] = within_2_days;
    j["within_3_days"] = within_3_days;
    return j;
}

RegressionMetrics evaluate_regression(const Vec& y_true, const Vec& y_pred)
{
    if (y_true.size() != y_pred.size())
        throw std::runtime_error("evaluate_regression: size mismatch");
    if (y_true.size() == 0)
        throw std::runtime_error("evaluate_regression: empty set");

    const Eigen::ArrayXd err = (y_pred - y_true).array().abs();
    const double n = double(err.size());

    RegressionMetrics m;
    m.mae  = err.mean();
    m.mse  = err.square().mean();
    m.rmse = std::sqrt(m.mse);
    m.within_1_day  = 100.0 * (err <= 1.0).count() / n;
    m.within_2_days = 100.0 * (err <= 2.0).count() / n;
    m.within_3_days = 100.0 * (err <= 3.0).count() / n;
    return m;
}

void report_metrics(const RegressionMetrics& m, const std::string& title)
{
    const std::string bar(50, '=');
    std::cout << '\n' << bar << '\n' << title << '\n' << bar << '\n'
              << std::fixed << std::setprecision(2)
              << "MAE: "  << m.mae  << " days\n"
              << "RMSE: " << m.rmse << " days\n"
              << std::setprecision(1)
              << "Within 1 day: "  << m.within_1_day  << "%\n"
              << "Within 2 days: " << m.within_2_days << "%\n"
              << "Within 3 days: " << m.within_3_days << "%\n"
              << bar << '\n';
    std::cout.unsetf(std::ios::floatfield);
    std::cout << std::setprecision(6);
}
