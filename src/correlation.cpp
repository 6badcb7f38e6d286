//
// Created by StatCalc contributors on 10/19/26.
//

#include "correlation.hpp"
#include "errors.hpp"
#include <algorithm>
#include <boost/math/distributions/students_t.hpp>
#include <cmath>
#include <fmt/format.h>
#include <limits>

CorrelationResult compute_pearson_r(const Sample &x, const Sample &y) {
    if (x.size() != y.size()) {
        throw(InvalidInputError(fmt::format("{} and {} must contain the same number of values ({} vs {}).",
                                            x.name(), y.name(), x.size(), y.size())));
    }
    x.require_at_least(2);
    y.require_at_least(2);

    const arma::vec &X = x.data();
    const arma::vec &Y = y.data();
    auto n = static_cast<double>(X.n_elem);

    double sum_x = 0;
    double sum_y = 0;
    double sum_xy = 0;
    double sum_xx = 0;
    double sum_yy = 0;
    for (arma::uword i = 0; i < X.n_elem; i++) {
        sum_x += X(i);
        sum_y += Y(i);
        sum_xy += X(i) * Y(i);
        sum_xx += X(i) * X(i);
        sum_yy += Y(i) * Y(i);
    }

    // n Sxx - Sx^2 cancels catastrophically for a constant sample; compare against the rounding scale.
    auto vanishes = [n](double ss, double sum_sq) {
        return !(ss > n * std::numeric_limits<double>::epsilon() * n * sum_sq);
    };
    double ssx = n * sum_xx - sum_x * sum_x;
    double ssy = n * sum_yy - sum_y * sum_y;
    if (!std::isfinite(ssx) || !std::isfinite(ssy) || !std::isfinite(sum_xy)) {
        throw(InvalidInputError(fmt::format("Values in {} and {} are too large to compute the correlation.", x.name(), y.name())));
    }
    if (vanishes(ssx, sum_xx)) {
        throw(DegenerateInputError(fmt::format("{} has zero variance; the correlation is undefined.", x.name())));
    }
    if (vanishes(ssy, sum_yy)) {
        throw(DegenerateInputError(fmt::format("{} has zero variance; the correlation is undefined.", y.name())));
    }

    CorrelationResult result{};
    result.n = X.n_elem;
    result.r = (n * sum_xy - sum_x * sum_y) / (std::sqrt(ssx) * std::sqrt(ssy));
    result.r = std::max(-1., std::min(1., result.r));

    if (result.n > 2) {
        double one_minus_r2 = 1 - result.r * result.r;
        if (one_minus_r2 <= 0) {
            result.p_value = 0.;
        } else {
            double t = result.r * std::sqrt((n - 2) / one_minus_r2);
            boost::math::students_t dist(n - 2);
            result.p_value = 2 * boost::math::cdf(boost::math::complement(dist, std::abs(t)));
        }
    }

    return result;
}
