/*  mlp_regressor.cpp  --------------------------------------- */
#include <algorithm>
#include <cmath>
#include <iostream>
#include <iomanip>
#include <limits>
#include <numeric>
#include <sstream>
#include <stdexcept>

#include "mlp_regressor.hpp"

namespace {

/* rows `idx[b, e)` of X / y → dense copies */
Mat take_rows(const Mat& X, const std::vector<size_t>& idx, size_t b, size_t e)
{
    Mat out(Eigen::Index(e - b), X.cols());
    for (size_t i = b; i < e; ++i) out.row(Eigen::Index(i - b)) = X.row(Eigen::Index(idx[i]));
    return out;
}

Vec take_rows(const Vec& y, const std::vector<size_t>& idx, size_t b, size_t e)
{
    Vec out(Eigen::Index(e - b));
    for (size_t i = b; i < e; ++i) out(Eigen::Index(i - b)) = y(Eigen::Index(idx[i]));
    return out;
}

std::string fmt(double v, int prec)
{
    std::ostringstream ss;
    ss << std::fixed << std::setprecision(prec) << v;
    return ss.str();
}

} // namespace


/* ---------------- Glorot-uniform initialisation ----------------- */
void MLPRegressor::init_params(std::mt19937& rng)
{
    std::vector<int> sizes{n_in_};
    sizes.insert(sizes.end(), hidden_.begin(), hidden_.end());
    sizes.push_back(1);

    coefs_.clear();
    intercepts_.clear();
    for (size_t l = 0; l + 1 < sizes.size(); ++l) {
        const int fan_in = sizes[l], fan_out = sizes[l + 1];
        const double bound = std::sqrt(6.0 / (fan_in + fan_out));   // ReLU factor 6
        std::uniform_real_distribution<double> dist(-bound, bound);
        auto draw = [&]() { return dist(rng); };

        coefs_     .push_back(Weights::NullaryExpr(fan_in, fan_out, draw));
        intercepts_.push_back(Bias   ::NullaryExpr(fan_out,          draw));
    }
}

void MLPRegressor::init_adam(Adam& adam) const
{
    adam.t = 0;
    adam.mW.clear(); adam.vW.clear(); adam.mb.clear(); adam.vb.clear();
    for (size_t l = 0; l < coefs_.size(); ++l) {
        adam.mW.push_back(Weights::Zero(coefs_[l].rows(), coefs_[l].cols()));
        adam.vW.push_back(Weights::Zero(coefs_[l].rows(), coefs_[l].cols()));
        adam.mb.push_back(Bias::Zero(intercepts_[l].size()));
        adam.vb.push_back(Bias::Zero(intercepts_[l].size()));
    }
}


/* ------------------------- forward ------------------------------ */
void MLPRegressor::forward(const Mat& X, std::vector<Eigen::MatrixXd>& A) const
{
    const size_t L = coefs_.size();
    A.resize(L + 1);
    A[0] = X;
    for (size_t l = 0; l < L; ++l) {
        A[l + 1].noalias() = A[l] * coefs_[l];
        A[l + 1].rowwise() += intercepts_[l];
        if (l + 1 < L) A[l + 1] = A[l + 1].cwiseMax(0.0);     // ReLU, output = identity
    }
}

Vec MLPRegressor::predict(const Mat& X) const
{
    if (coefs_.empty()) throw std::runtime_error("MLPRegressor: model not fitted");
    if (X.cols() != n_in_)
        throw std::runtime_error("MLPRegressor: expected " + std::to_string(n_in_) +
                                 " features, got " + std::to_string(X.cols()));
    std::vector<Eigen::MatrixXd> A;
    forward(X, A);
    return A.back().col(0);
}

double MLPRegressor::score(const Mat& X, const Vec& y) const
{
    const Vec    yhat   = predict(X);
    const double ss_res = (y - yhat).squaredNorm();
    const double ss_tot = (y.array() - y.mean()).square().sum();
    if (ss_tot == 0.0) return ss_res == 0.0 ? 1.0 : 0.0;
    return 1.0 - ss_res / ss_tot;
}


/* ------------------------- backward ----------------------------- *
 *  loss = ½·mean((ŷ-y)²) + ½·α·ΣW² / n
 *  dW   = (Aᵀ·δ + α·W) / n ,  db = mean(δ)
 * ---------------------------------------------------------------- */
double MLPRegressor::backprop(const Mat& X, const Vec& y, double alpha, Grads& g) const
{
    const double n = double(X.rows());
    const size_t L = coefs_.size();

    std::vector<Eigen::MatrixXd> A;
    forward(X, A);

    Eigen::MatrixXd delta = A.back();
    delta.col(0) -= y;

    double l2 = 0.0;
    for (const auto& W : coefs_) l2 += W.squaredNorm();
    const double loss = 0.5 * delta.squaredNorm() / n + 0.5 * alpha * l2 / n;

    g.dW.resize(L);
    g.db.resize(L);
    for (size_t l = L; l-- > 0; ) {
        g.dW[l] = (A[l].transpose() * delta + alpha * coefs_[l]) / n;
        g.db[l] = delta.colwise().mean();
        if (l > 0) {
            Eigen::MatrixXd back = delta * coefs_[l].transpose();
            delta = back.cwiseProduct((A[l].array() > 0.0).cast<double>().matrix());
        }
    }
    return loss;
}

void MLPRegressor::step(Adam& adam, const Grads& g)
{
    ++adam.t;
    const double lr_t = adam.lr * std::sqrt(1.0 - std::pow(adam.beta2, adam.t)) /
                                  (1.0 - std::pow(adam.beta1, adam.t));

    for (size_t l = 0; l < coefs_.size(); ++l) {
        adam.mW[l] = adam.beta1 * adam.mW[l] + (1.0 - adam.beta1) * g.dW[l];
        adam.vW[l] = adam.beta2 * adam.vW[l] + (1.0 - adam.beta2) * g.dW[l].cwiseAbs2();
        adam.mb[l] = adam.beta1 * adam.mb[l] + (1.0 - adam.beta1) * g.db[l];
        adam.vb[l] = adam.beta2 * adam.vb[l] + (1.0 - adam.beta2) * g.db[l].cwiseAbs2();

        coefs_[l].array()      -= lr_t * adam.mW[l].array() / (adam.vW[l].array().sqrt() + adam.eps);
        intercepts_[l].array() -= lr_t * adam.mb[l].array() / (adam.vb[l].array().sqrt() + adam.eps);
    }
}


/* ---------------------------------------------------------------
 *  fit – minibatch Adam, patience on hold-out R² (or on the
 *        training loss when the hold-out would be too small)
 * --------------------------------------------------------------- */
void MLPRegressor::fit(const Mat& X, const Vec& y, const TrainOpt& opt)
{
    const size_t N = size_t(X.rows());
    if (!N)                      throw std::runtime_error("MLPRegressor: no training rows");
    if (size_t(y.size()) != N)   throw std::runtime_error("MLPRegressor: X/y row mismatch");
    for (int h : opt.hidden)
        if (h <= 0) throw std::runtime_error("MLPRegressor: hidden layer size must be > 0");

    std::mt19937 rng(opt.seed);
    n_in_   = int(X.cols());
    hidden_ = opt.hidden;
    init_params(rng);

    /* ---------- 1. early-stopping hold-out ---------------------- */
    std::vector<size_t> idx(N);
    std::iota(idx.begin(), idx.end(), size_t(0));
    std::shuffle(idx.begin(), idx.end(), rng);

    size_t n_val = opt.val_frac > 0 ? size_t(std::ceil(opt.val_frac * N)) : 0;
    bool early_stop = n_val >= 2 && n_val < N;
    if (opt.val_frac > 0 && !early_stop) {
        logW("hold-out of " + std::to_string(n_val) + " rows is unusable – "
             "early stopping falls back to training loss");
        n_val = 0;
    }
    const size_t n_tr = N - n_val;

    const Mat Xtr = take_rows(X, idx, n_val, N);
    const Vec ytr = take_rows(y, idx, n_val, N);
    const Mat Xva = take_rows(X, idx, 0, n_val);
    const Vec yva = take_rows(y, idx, 0, n_val);

    /* ---------- 2. optimiser ------------------------------------ */
    Adam adam;
    adam.lr = opt.lr;
    init_adam(adam);

    const size_t batch = std::max<size_t>(1, std::min<size_t>(size_t(std::max(opt.batch, 1)), n_tr));

    n_iter_ = 0;
    loss_curve_.clear();
    val_scores_.clear();
    best_val_score_ = -std::numeric_limits<double>::infinity();
    double best_loss = std::numeric_limits<double>::infinity();
    int    stall     = 0;

    std::vector<Weights> best_W = coefs_;
    std::vector<Bias>    best_b = intercepts_;

    std::vector<size_t> order(n_tr);
    std::iota(order.begin(), order.end(), size_t(0));
    Grads g;
    bool stopped = false;

    /* ---------- 3. epoch loop ----------------------------------- */
    for (int ep = 0; ep < opt.epochs; ++ep) {
        std::shuffle(order.begin(), order.end(), rng);

        double acc = 0.0;
        for (size_t b = 0; b < n_tr; b += batch) {
            const size_t e = std::min(b + batch, n_tr);
            const Mat Xb = take_rows(Xtr, order, b, e);
            const Vec yb = take_rows(ytr, order, b, e);
            acc += backprop(Xb, yb, opt.alpha, g) * double(e - b);
            step(adam, g);
        }
        ++n_iter_;
        loss_curve_.push_back(acc / double(n_tr));
        if (g_verbose)
            std::cout << "Iteration " << n_iter_ << ", loss = "
                      << fmt(loss_curve_.back(), 8) << '\n';

        if (early_stop) {
            const double s = score(Xva, yva);
            val_scores_.push_back(s);
            if (g_verbose) std::cout << "Validation score: " << fmt(s, 6) << '\n';

            if (s < best_val_score_ + opt.tol) ++stall; else stall = 0;
            if (s > best_val_score_) {
                best_val_score_ = s;
                best_W = coefs_;
                best_b = intercepts_;
            }
        } else {
            const double l = loss_curve_.back();
            if (l > best_loss - opt.tol) ++stall; else stall = 0;
            if (l < best_loss) best_loss = l;
        }

        if (!g_verbose) progress("epoch", size_t(ep + 1), size_t(opt.epochs));

        if (stall > opt.patience) {
            if (!g_verbose) std::cerr << '\n';
            logI(std::string(early_stop ? "Validation score" : "Training loss") +
                 " did not improve more than tol=" + fmt(opt.tol, 6) + " for " +
                 std::to_string(opt.patience) + " consecutive epochs. Stopping.");
            stopped = true;
            break;
        }
    }
    if (!stopped)
        logW("Maximum iterations (" + std::to_string(opt.epochs) +
             ") reached and the optimization hasn't converged yet.");

    /* restore the best hold-out checkpoint */
    if (early_stop) {
        coefs_      = std::move(best_W);
        intercepts_ = std::move(best_b);
    }
}


/* ------------------------- save / load -------------------------- */
ojson MLPRegressor::to_json() const
{
    ojson arch;
    arch["input_size"]    = n_in_;
    arch["hidden_layers"] = hidden_;
    arch["output_size"]   = 1;
    arch["activation"]    = "relu";

    ojson weights = ojson::array(), biases = ojson::array();
    for (size_t l = 0; l < coefs_.size(); ++l) {
        const Weights& W = coefs_[l];
        ojson mat = ojson::array();
        for (Eigen::Index r = 0; r < W.rows(); ++r) {
            std::vector<double> row(size_t(W.cols()));
            for (Eigen::Index c = 0; c < W.cols(); ++c) row[size_t(c)] = W(r, c);
            mat.push_back(row);
        }
        weights.push_back(std::move(mat));

        const Bias& b = intercepts_[l];
        biases.push_back(std::vector<double>(b.data(), b.data() + b.size()));
    }

    ojson j;
    j["architecture"] = std::move(arch);
    j["weights"]      = std::move(weights);
    j["biases"]       = std::move(biases);
    return j;
}

void MLPRegressor::from_json(const ojson& j)
{
    const ojson& arch = j.at("architecture");
    if (arch.at("activation").get<std::string>() != "relu")
        throw std::runtime_error("MLPRegressor: unsupported activation " +
                                 arch.at("activation").get<std::string>());
    if (arch.at("output_size").get<int>() != 1)
        throw std::runtime_error("MLPRegressor: output_size must be 1");

    const int              n_in   = arch.at("input_size").get<int>();
    const std::vector<int> hidden = arch.at("hidden_layers").get<std::vector<int>>();

    std::vector<int> sizes{n_in};
    sizes.insert(sizes.end(), hidden.begin(), hidden.end());
    sizes.push_back(1);

    const ojson& jw = j.at("weights");
    const ojson& jb = j.at("biases");
    if (jw.size() != sizes.size() - 1 || jb.size() != sizes.size() - 1)
        throw std::runtime_error("MLPRegressor: layer count mismatch");

    std::vector<Weights> W;
    std::vector<Bias>    B;
    for (size_t l = 0; l + 1 < sizes.size(); ++l) {
        const auto rows = jw[l].get<std::vector<std::vector<double>>>();
        const auto bias = jb[l].get<std::vector<double>>();
        if (rows.size() != size_t(sizes[l]) || bias.size() != size_t(sizes[l + 1]))
            throw std::runtime_error("MLPRegressor: shape mismatch in layer " + std::to_string(l));

        Weights m(sizes[l], sizes[l + 1]);
        for (size_t r = 0; r < rows.size(); ++r) {
            if (rows[r].size() != size_t(sizes[l + 1]))
                throw std::runtime_error("MLPRegressor: ragged weights in layer " + std::to_string(l));
            for (size_t c = 0; c < rows[r].size(); ++c) m(Eigen::Index(r), Eigen::Index(c)) = rows[r][c];
        }
        W.push_back(std::move(m));
        B.push_back(Eigen::Map<const Bias>(bias.data(), Eigen::Index(bias.size())));
    }

    n_in_       = n_in;
    hidden_     = hidden;
    coefs_      = std::move(W);
    intercepts_ = std::move(B);
}


std::unique_ptr<IModel> make_mlp() { return std::make_unique<MLPRegressor>(); }
