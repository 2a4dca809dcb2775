#pragma once
#include <string>
#include <vector>

#include "model_iface.hpp"
#include "scaler.hpp"
#include "metrics.hpp"

constexpr char MODEL_FILE  [] = "model.json";
constexpr char SCALER_FILE [] = "scaler.json";
constexpr char METRICS_FILE[] = "training_metrics.json";

/* dump with indent 2, overwrite; throws std::runtime_error on I/O failure */
void write_json_file(const std::string& path, const ojson& j);
ojson read_json_file(const std::string& path);

/*  <dir>/model.json, scaler.json, training_metrics.json
    `dir` (and parents) is created if absent.                      */
void export_model_artifacts(const std::string&              dir,
                            const IModel&                   model,
                            const StandardScaler&           scaler,
                            const RegressionMetrics&        metrics,
                            const std::vector<std::string>& feature_names);
