//
// Created by StatCalc contributors on 10/19/26.
//

#include "ttest.hpp"
#include "errors.hpp"
#include <algorithm>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>

TTestResult compute_t_test(const Sample &a, const Sample &b, bool equal_variances) {
    a.require_at_least(2);
    b.require_at_least(2);

    TTestResult result{};
    result.n_a = a.size();
    result.n_b = b.size();
    result.mean_a = a.mean();
    result.mean_b = b.mean();
    result.variance_a = a.variance();
    result.variance_b = b.variance();
    result.pooled = equal_variances;
    if (!std::isfinite(result.mean_a) || !std::isfinite(result.mean_b)
        || !std::isfinite(result.variance_a) || !std::isfinite(result.variance_b)) {
        throw(InvalidInputError(fmt::format("Values in {} and {} are too large to compute the t-test.", a.name(), b.name())));
    }

    auto n1 = static_cast<double>(result.n_a);
    auto n2 = static_cast<double>(result.n_b);
    result.unbalanced = std::abs(n1 / n2 - 1) > max_size_imbalance;

    if (equal_variances) {
        double pooled_variance = ((n1 - 1) * result.variance_a + (n2 - 1) * result.variance_b) / (n1 + n2 - 2);
        result.standard_error = std::sqrt(pooled_variance * (1. / n1 + 1. / n2));
        result.degrees_of_freedom = n1 + n2 - 2;
    } else {
        double va = result.variance_a / n1;
        double vb = result.variance_b / n2;
        result.standard_error = std::sqrt(va + vb);
        // Welch-Satterthwaite
        result.degrees_of_freedom = std::pow(va + vb, 2) / (std::pow(va, 2) / (n1 - 1) + std::pow(vb, 2) / (n2 - 1));
    }

    if (!std::isfinite(result.standard_error) || !std::isfinite(result.degrees_of_freedom)) {
        throw(InvalidInputError(fmt::format("Values in {} and {} are too large to compute the t-test.", a.name(), b.name())));
    }

    double scale = std::max(std::abs(result.mean_a), std::abs(result.mean_b));
    if (!(result.standard_error > 4 * std::numeric_limits<double>::epsilon() * scale)) {
        throw(DegenerateInputError(fmt::format("Standard error is zero: {} and {} are both constant.", a.name(), b.name())));
    }

    result.t_statistic = (result.mean_a - result.mean_b) / result.standard_error;

    boost::math::students_t dist(result.degrees_of_freedom);
    result.p_value = 2 * boost::math::cdf(boost::math::complement(dist, std::abs(result.t_statistic)));

    return result;
}
