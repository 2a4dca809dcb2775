/*  scaler.cpp  ---------------------------------------------- */
#include <cmath>
#include <limits>
#include <stdexcept>

#include "scaler.hpp"

void StandardScaler::fit(const Mat& X)
{
    if (X.rows() == 0) throw std::runtime_error("StandardScaler: empty fit set");

    mean_  = X.colwise().mean().transpose();
    scale_ = ((X.rowwise() - mean_.transpose()).array().square()
                 .colwise().sum() / double(X.rows())).sqrt().matrix().transpose();

    /* constant feature → scale 1; the bound grows with n and |mean| so that
       summation round-off on a constant column (22.1, 24.3, ...) counts as 0 */
    const double eps = std::numeric_limits<double>::epsilon();
    const double n   = double(X.rows());
    for (Eigen::Index j = 0; j < scale_.size(); ++j) {
        const double var   = scale_(j) * scale_(j);
        const double drift = n * std::fabs(mean_(j)) * eps;
        if (var <= n * eps * var + drift * drift)
            scale_(j) = 1.0;
    }
}

void StandardScaler::check_width(const Mat& X) const
{
    if (!fitted()) throw std::runtime_error("StandardScaler: not fitted");
    if (X.cols() != mean_.size())
        throw std::runtime_error("StandardScaler: expected " +
                                 std::to_string(mean_.size()) + " features, got " +
                                 std::to_string(X.cols()));
}

Mat StandardScaler::transform(const Mat& X) const
{
    check_width(X);
    Mat Z = X;
    Z.rowwise() -= mean_.transpose();
    Z.array().rowwise() /= scale_.transpose().array();
    return Z;
}

Mat StandardScaler::inverse_transform(const Mat& X) const
{
    check_width(X);
    Mat Z = X;
    Z.array().rowwise() *= scale_.transpose().array();
    Z.rowwise() += mean_.transpose();
    return Z;
}


ojson StandardScaler::to_json(const std::vector<std::string>& feature_names) const
{
    ojson j;
    j["mean"]          = std::vector<double>(mean_.data(),  mean_.data()  + mean_.size());
    j["scale"]         = std::vector<double>(scale_.data(), scale_.data() + scale_.size());
    j["feature_names"] = feature_names;
    return j;
}

void StandardScaler::from_json(const ojson& j)
{
    auto m = j.at("mean") .get<std::vector<double>>();
    auto s = j.at("scale").get<std::vector<double>>();
    if (m.size() != s.size() || m.empty())
        throw std::runtime_error("StandardScaler: mean/scale size mismatch");

    mean_  = Eigen::Map<const Vec>(m.data(), Eigen::Index(m.size()));
    scale_ = Eigen::Map<const Vec>(s.data(), Eigen::Index(s.size()));
}
