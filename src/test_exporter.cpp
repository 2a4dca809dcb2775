#include <cstdio>
#include <fstream>
#include <sstream>
#include <stdexcept>
#include <unistd.h>

#include "exporter.hpp"
#include "mlp_regressor.hpp"
#include "cycle_features.hpp"
#include "test_util.hpp"

namespace {

std::string slurp(const std::string& path)
{
    std::ifstream f(path, std::ios::binary);
    std::ostringstream ss;
    ss << f.rdbuf();
    return ss.str();
}

void remove_artifacts(const std::string& dir)
{
    for (const char* f : {MODEL_FILE, SCALER_FILE, METRICS_FILE})
        std::remove(join_path(dir, f).c_str());
}

} // namespace

int main()
{
    std::cout << "Testing JSON export..." << std::endl;

    /* small fitted model + scaler */
    Mat X(40, NUM_FEATS);
    Vec y(40);
    for (int i = 0; i < 40; ++i) {
        for (int k = 0; k < NUM_FEATS; ++k) X(i, k) = 20.0 + (i * 5 + k * 11) % 23;
        y(i) = 25.0 + i % 9;
    }
    StandardScaler sc;
    sc.fit(X);

    TrainOpt opt;
    opt.epochs = 5;
    MLPRegressor model;
    model.fit(sc.transform(X), y, opt);

    RegressionMetrics m = evaluate_regression(y, model.predict(sc.transform(X)));
    const auto names = feature_names();

    const std::string root = "test_exporter_out";
    const std::string dir  = root + "/nested/model";

    /* ---- first export creates the directory ------------------ */
    export_model_artifacts(dir, model, sc, m, names);
    check(is_directory(dir), "output directory created with parents");
    const std::string model1  = slurp(join_path(dir, MODEL_FILE));
    const std::string scaler1 = slurp(join_path(dir, SCALER_FILE));
    const std::string metric1 = slurp(join_path(dir, METRICS_FILE));
    check(!model1.empty() && !scaler1.empty() && !metric1.empty(), "three artifacts written");

    /* ---- determinism: second run is byte-identical ------------ */
    export_model_artifacts(dir, model, sc, m, names);
    check(slurp(join_path(dir, MODEL_FILE))   == model1,  "model.json byte-identical on re-export");
    check(slurp(join_path(dir, SCALER_FILE))  == scaler1, "scaler.json byte-identical on re-export");
    check(slurp(join_path(dir, METRICS_FILE)) == metric1, "training_metrics.json byte-identical on re-export");

    /* ---- schema -------------------------------------------------- */
    {
        ojson jm = read_json_file(join_path(dir, MODEL_FILE));
        check(jm.begin().key() == "architecture", "model.json starts with architecture");
        check(jm["architecture"]["input_size"] == NUM_FEATS &&
              jm["architecture"]["output_size"] == 1, "model.json sizes");
        check(jm["weights"].size() == jm["biases"].size(), "one bias vector per weight matrix");

        MLPRegressor back;
        back.from_json(jm);
        check(back.predict(sc.transform(X)).isApprox(model.predict(sc.transform(X)), 1e-9),
              "reloaded model predicts the same");

        ojson js = read_json_file(join_path(dir, SCALER_FILE));
        check(js["mean"].size() == size_t(NUM_FEATS) && js["scale"].size() == size_t(NUM_FEATS),
              "scaler.json has 13 means / scales");
        check(js["feature_names"].get<std::vector<std::string>>() == names, "scaler.json feature order");

        ojson jt = read_json_file(join_path(dir, METRICS_FILE));
        check(jt.size() == 6 && jt.contains("rmse") && jt.contains("within_3_days"), "metrics keys");
    }

    /* ---- overwrite, never merge -------------------------------- */
    {
        write_json_file(join_path(dir, METRICS_FILE), ojson{{"stale", 1}});
        export_model_artifacts(dir, model, sc, m, names);
        ojson jt = read_json_file(join_path(dir, METRICS_FILE));
        check(!jt.contains("stale") && slurp(join_path(dir, METRICS_FILE)) == metric1,
              "existing file is replaced, not merged");
    }

    bool threw = false;
    try { export_model_artifacts(dir, model, sc, m, {"only", "three", "names"}); }
    catch (const std::runtime_error&) { threw = true; }
    check(threw, "feature name count must match the scaler");

    threw = false;
    try { read_json_file(join_path(dir, "missing.json")); }
    catch (const std::runtime_error&) { threw = true; }
    check(threw, "reading a missing file throws");

    remove_artifacts(dir);
    ::rmdir(dir.c_str());
    ::rmdir((root + "/nested").c_str());
    ::rmdir(root.c_str());

    return finish("test_exporter");
}
