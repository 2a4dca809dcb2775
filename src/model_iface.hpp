/* ──────────────────────────────────────────────────────────────
   model_iface.hpp     –  the abstraction layer
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <memory>
#include <string>
#include <vector>

#include <Eigen/Dense>
#include <nlohmann/json.hpp>

#include "common.hpp"

using ojson = nlohmann::ordered_json;     // key order = insertion order

struct TrainOpt {
    /* pipeline */
    std::string data_path  = "data/FedCycleData071012.csv";
    std::string out_dir    = "public/model";
    int         seq_len    = SEQ_LEN;
    unsigned    seed       = 42;

    /* MLP hyper-params */
    std::vector<int> hidden = {32, 16};
    double  alpha      = 0.01;       // L2 penalty
    double  lr         = 0.001;      // Adam step size
    int     batch      = 200;
    int     epochs     = 500;        // max iterations
    int     patience   = 20;         // n_iter_no_change
    double  val_frac   = 0.15;       // early-stopping hold-out of TRAIN
    double  tol        = 1e-4;
};

/*  Row-major design matrix: one sample per row. */
using Mat = Eigen::Matrix<double, Eigen::Dynamic, Eigen::Dynamic, Eigen::RowMajor>;
using Vec = Eigen::VectorXd;

struct IModel {
    virtual ~IModel() = default;

    /*  fit on (X, y); X is already standardized                    */
    virtual void fit(const Mat& X, const Vec& y, const TrainOpt& opt) = 0;

    /*  one prediction per row of X                                 */
    virtual Vec predict(const Mat& X) const = 0;

    /*  architecture + parameters in the exported layout            */
    virtual ojson to_json() const = 0;
};

std::unique_ptr<IModel> make_mlp();
