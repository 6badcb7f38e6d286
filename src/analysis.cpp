//
// Created by StatCalc contributors on 10/19/26.
//

#include "analysis.hpp"

TTestReport run_t_test(const Sample &a, const Sample &b, double alpha, const std::string &center) {
    TTestReport report{};
    report.levene = test_equal_variances(a, b, alpha, center);
    report.ttest = compute_t_test(a, b, report.levene.equal_variances);
    return report;
}

CorrelationResult run_correlation(const Sample &x, const Sample &y) {
    return compute_pearson_r(x, y);
}
