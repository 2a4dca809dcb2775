/* ──────────────────────────────────────────────────────────────
   mlp_regressor.hpp  –  dense ReLU regressor on Eigen, Adam + L2,
                         early stopping on a held-out slice
   ────────────────────────────────────────────────────────────── */
#pragma once
#include <random>
#include <string>
#include <vector>

#include "model_iface.hpp"

class MLPRegressor : public IModel
{
public:
    using Weights = Eigen::MatrixXd;       // (fan_in × fan_out)
    using Bias    = Eigen::RowVectorXd;    // (fan_out)

    void  fit    (const Mat& X, const Vec& y, const TrainOpt& opt) override;
    Vec   predict(const Mat& X) const override;
    ojson to_json() const override;

    /* rebuild from an exported model.json; throws on shape mismatch */
    void  from_json(const ojson& j);

    /* R² of predict(X) against y */
    double score(const Mat& X, const Vec& y) const;

    const std::vector<Weights>& coefs()      const { return coefs_;      }
    const std::vector<Bias>&    intercepts() const { return intercepts_; }
    const std::vector<int>&     hidden()     const { return hidden_;     }
    int  input_size() const { return n_in_; }
    int  n_iter()     const { return n_iter_; }

    const std::vector<double>& loss_curve()        const { return loss_curve_; }
    const std::vector<double>& validation_scores() const { return val_scores_; }
    double best_validation_score() const { return best_val_score_; }

private:
    struct Grads {
        std::vector<Weights> dW;
        std::vector<Bias>    db;
    };

    /* Adam moments, one slot per parameter tensor */
    struct Adam {
        double lr = 1e-3, beta1 = 0.9, beta2 = 0.999, eps = 1e-8;
        long   t  = 0;
        std::vector<Weights> mW, vW;
        std::vector<Bias>    mb, vb;
    };

    void init_params(std::mt19937& rng);
    void init_adam  (Adam& adam) const;

    /* forward pass keeping every layer's activation */
    void   forward (const Mat& X, std::vector<Eigen::MatrixXd>& A) const;
    double backprop(const Mat& X, const Vec& y, double alpha, Grads& g) const;
    void   step    (Adam& adam, const Grads& g);

    int              n_in_ = 0;
    std::vector<int> hidden_;
    std::vector<Weights> coefs_;
    std::vector<Bias>    intercepts_;

    int                 n_iter_ = 0;
    std::vector<double> loss_curve_;
    std::vector<double> val_scores_;
    double              best_val_score_ = 0.0;
};
