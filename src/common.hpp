/*───────────────────────────────────────────────────────────
 *  common.hpp   –  shared types, constants, log & fs helpers
 *───────────────────────────────────────────────────────────*/
#pragma once

#include <string>
#include <vector>
#include <cstddef>
#include <limits>

/* ---------- 全局常量 ---------- */
constexpr int    SEQ_LEN          = 6;       // previous cycles per window
constexpr int    EXTRA_FEATS      = 7;       // mean std min max period age bmi
constexpr int    NUM_FEATS        = SEQ_LEN + EXTRA_FEATS;   // 13

constexpr double CYCLE_MIN        = 15.0;    // inclusive
constexpr double CYCLE_MAX        = 60.0;    // inclusive
constexpr double PERIOD_MIN_EXCL  = 0.0;
constexpr double PERIOD_MAX_EXCL  = 15.0;

constexpr double DEFAULT_PERIOD   = 5.0;
constexpr double DEFAULT_AGE      = 30.0;
constexpr double DEFAULT_BMI      = 22.0;

constexpr double NaN = std::numeric_limits<double>::quiet_NaN();

/* ---------- 全局开关 ---------- */
extern bool g_verbose;                   // 默认 = false，由 CLI 设置

/* ────────────────── 基础数据结构 ────────────────── */
struct Sample {
    std::vector<double> feat;            // W + EXTRA_FEATS values
    double              target = 0;      // next cycle length (days)
    std::string         person;          // 来源 person id (diagnostics only)
};

/* ────────────────── log / 进度 & 文件工具 ────────────────── */
void logI(const std::string& msg);
void logW(const std::string& msg);
void logE(const std::string& msg);

bool file_exists (const std::string& path);
bool is_directory(const std::string& path);
bool make_dirs   (const std::string& path);   // mkdir -p

std::string join_path(const std::string& dir, const std::string& name);

void progress(const std::string& tag,
              size_t cur, size_t tot, size_t barWidth = 40);

/* ────────────────── 数值小工具 ────────────────── */
/* cell → double, anything that is not a complete finite number → NaN */
double to_number(const std::string& cell);

std::string trim(const std::string& s);
std::string to_lower(std::string s);
std::string join(const std::vector<std::string>& v,
                 const std::string& sep = ", ");
