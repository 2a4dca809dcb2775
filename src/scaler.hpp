#pragma once
#include <string>
#include <vector>

#include "model_iface.hpp"

/*  Per-feature z-score: (x - mean) / scale.
    scale = population std; a constant column gets scale 1.0 so it
    maps to 0 instead of dividing by zero.                           */
class StandardScaler {
public:
    void fit(const Mat& X);

    Mat  transform        (const Mat& X) const;
    Mat  inverse_transform(const Mat& X) const;

    bool        fitted()  const { return mean_.size() > 0; }
    const Vec&  mean()    const { return mean_;  }
    const Vec&  scale()   const { return scale_; }

    /* {mean, scale, feature_names} */
    ojson to_json  (const std::vector<std::string>& feature_names) const;
    void  from_json(const ojson& j);

private:
    void check_width(const Mat& X) const;

    Vec mean_;
    Vec scale_;
};
