/*  exporter.cpp  -------------------------------------------- */
#include <fstream>
#include <stdexcept>

#include "exporter.hpp"

void write_json_file(const std::string& path, const ojson& j)
{
    std::ofstream f(path, std::ios::binary | std::ios::trunc);
    if (!f) throw std::runtime_error("Cannot write " + path);
    f << j.dump(2) << '\n';
    if (!f) throw std::runtime_error("Write failed for " + path);
}

ojson read_json_file(const std::string& path)
{
    std::ifstream f(path);
    if (!f) throw std::runtime_error("Cannot read " + path);
    try {
        return ojson::parse(f);
    } catch (const nlohmann::json::parse_error& e) {
        throw std::runtime_error("Malformed JSON in " + path + ": " + e.what());
    }
}


void export_model_artifacts(const std::string&              dir,
                            const IModel&                   model,
                            const StandardScaler&           scaler,
                            const RegressionMetrics&        metrics,
                            const std::vector<std::string>& feature_names)
{
    if (!make_dirs(dir)) throw std::runtime_error("mkdir failed: " + dir);

    if (size_t(scaler.mean().size()) != feature_names.size())
        throw std::runtime_error("scaler has " + std::to_string(scaler.mean().size()) +
                                 " features but " + std::to_string(feature_names.size()) +
                                 " names were given");

    const std::string model_path = join_path(dir, MODEL_FILE);
    write_json_file(model_path, model.to_json());
    logI("Model saved → " + model_path);

    const std::string scaler_path = join_path(dir, SCALER_FILE);
    write_json_file(scaler_path, scaler.to_json(feature_names));
    logI("Scaler saved → " + scaler_path);

    const std::string metrics_path = join_path(dir, METRICS_FILE);
    write_json_file(metrics_path, metrics.to_json());
    logI("Metrics saved → " + metrics_path);
}
