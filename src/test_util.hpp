/*  test_util.hpp  –  tiny check helpers for the test_* drivers  */
#pragma once
#include <algorithm>
#include <cmath>
#include <iostream>
#include <string>

static int g_failed = 0;

static inline void check(bool ok, const std::string& what)
{
    std::cout << (ok ? "✅ " : "❌ ") << what << std::endl;
    if (!ok) ++g_failed;
}

static inline bool near(double a, double b, double eps = 1e-9)
{
    return std::fabs(a - b) <= eps * std::max(1.0, std::max(std::fabs(a), std::fabs(b)));
}

/* exit code for main() */
static inline int finish(const std::string& suite)
{
    if (g_failed) std::cout << suite << ": " << g_failed << " check(s) failed" << std::endl;
    else          std::cout << suite << ": all checks passed" << std::endl;
    return g_failed ? 1 : 0;
}
