/*  trainer.cpp  --------------------------------------------- */
#include <algorithm>
#include <cmath>
#include <iostream>
#include <random>
#include <stdexcept>

#include "trainer.hpp"

DataSplit split_dataset(const std::vector<Sample>& all, unsigned seed)
{
    DataSplit out;
    if (all.empty()) return out;

    std::vector<Sample> tmp = all;           // 复制再打乱
    std::mt19937 rng(seed);
    std::shuffle(tmp.begin(), tmp.end(), rng);

    /* test_size=0.3, then test_size=0.5 of the remainder (ceil on the test side) */
    const size_t n      = tmp.size();
    const size_t n_rest = size_t(std::ceil(0.3 * n));
    const size_t n_tr   = n - n_rest;
    const size_t n_te   = size_t(std::ceil(0.5 * n_rest));
    const size_t n_va   = n_rest - n_te;

    auto it = tmp.begin();
    out.train.assign(it,                it + n_tr);
    out.val  .assign(it + n_tr,         it + n_tr + n_va);
    out.test .assign(it + n_tr + n_va,  tmp.end());
    return out;
}

Mat features_of(const std::vector<Sample>& DS)
{
    const Eigen::Index d = DS.empty() ? 0 : Eigen::Index(DS.front().feat.size());
    Mat X(Eigen::Index(DS.size()), d);
    for (size_t i = 0; i < DS.size(); ++i) {
        if (Eigen::Index(DS[i].feat.size()) != d)
            throw std::runtime_error("ragged feature vectors at sample " + std::to_string(i));
        X.row(Eigen::Index(i)) = Eigen::Map<const Eigen::RowVectorXd>(DS[i].feat.data(), d);
    }
    return X;
}

Vec targets_of(const std::vector<Sample>& DS)
{
    Vec y(Eigen::Index(DS.size()));
    for (size_t i = 0; i < DS.size(); ++i) y(Eigen::Index(i)) = DS[i].target;
    return y;
}


TrainResult train_pipeline(const std::vector<Sample>& DS, const TrainOpt& opt)
{
    TrainResult R;

    /* ---------- 1. split ---------------------------------------- */
    DataSplit sp = split_dataset(DS, opt.seed);
    R.n_train = sp.train.size();
    R.n_val   = sp.val.size();
    R.n_test  = sp.test.size();

    std::cout << "\nData split:\n"
              << "  Train: "      << R.n_train << " samples\n"
              << "  Validation: " << R.n_val   << " samples\n"
              << "  Test: "       << R.n_test  << " samples\n";
    if (!R.n_train || !R.n_test)
        throw std::runtime_error("too few samples to split (" + std::to_string(DS.size()) + ")");

    /* ---------- 2. scale on TRAIN only -------------------------- */
    const Mat X_tr = features_of(sp.train);
    R.scaler.fit(X_tr);
    const Mat Z_tr = R.scaler.transform(X_tr);
    const Mat Z_te = R.scaler.transform(features_of(sp.test));

    /* ---------- 3. fit ------------------------------------------ */
    std::cout << "\nTraining model...\n";
    R.model = make_mlp();
    R.model->fit(Z_tr, targets_of(sp.train), opt);

    /* ---------- 4. evaluate ------------------------------------- */
    if (R.n_val) {
        R.val = evaluate_regression(targets_of(sp.val),
                                    R.model->predict(R.scaler.transform(features_of(sp.val))));
        logI("validation MAE=" + std::to_string(R.val.mae) +
             "  RMSE=" + std::to_string(R.val.rmse));
    }
    R.test = evaluate_regression(targets_of(sp.test), R.model->predict(Z_te));
    return R;
}
