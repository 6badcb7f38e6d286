//
// Created by StatCalc contributors on 10/19/26.
//

#include "report.hpp"
#include <fmt/ostream.h>

void print_t_test_warnings(std::ostream &os, const TTestReport &report) {
    if (report.ttest.unbalanced) {
        fmt::print(os, "Warning: Difference in sample size exceeds {:.0f}%, adjust your data for more reliable results\n",
                   max_size_imbalance * 100);
    }
}

void print_t_test(std::ostream &os, const TTestReport &report, bool verbose) {
    const auto &t = report.ttest;
    const auto &lev = report.levene;

    fmt::print(os, "\nResults:\n");
    if (verbose) {
        fmt::print(os, "Levene's Test ({}): W = {:.4f}, p = {:.4f}\n", lev.center, lev.statistic, lev.p_value);
        fmt::print(os, "Equal Variances: {} (alpha = {})\n", lev.equal_variances ? "assumed" : "not assumed", lev.threshold);
        fmt::print(os, "Formula: {}\n", t.pooled ? "pooled variance" : "Welch");
        fmt::print(os, "Mean of Sample 1: {:.4f} (n = {})\n", t.mean_a, t.n_a);
        fmt::print(os, "Mean of Sample 2: {:.4f} (n = {})\n", t.mean_b, t.n_b);
        fmt::print(os, "Standard Error: {:.4f}\n", t.standard_error);
    }
    fmt::print(os, "T Statistic: {:.4f}\n", t.t_statistic);
    fmt::print(os, "Degree of Freedom: {:.2f}\n", t.degrees_of_freedom);
    fmt::print(os, "Variance of Sample 1: {:.4f}\n", t.variance_a);
    fmt::print(os, "Variance of Sample 2: {:.4f}\n", t.variance_b);
    if (verbose) {
        fmt::print(os, "P Value (two-sided): {:.4g}\n", t.p_value);
    }
}

void print_correlation(std::ostream &os, const CorrelationResult &result, bool verbose) {
    fmt::print(os, "\nThe Correlation Coefficient (r) is: {:.4f}\n", result.r);
    if (verbose) {
        fmt::print(os, "Pairs: {}\n", result.n);
        if (result.p_value) {
            fmt::print(os, "P Value (two-sided): {:.4g}\n", *result.p_value);
        } else {
            fmt::print(os, "P Value (two-sided): undefined for fewer than 3 pairs\n");
        }
    }
}
