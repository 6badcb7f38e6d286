//
// Created by StatCalc contributors on 10/19/26.
//

#include "levene.hpp"
#include "errors.hpp"
#include <algorithm>
#include <boost/math/distributions/fisher_f.hpp>
#include <cmath>
#include <fmt/format.h>
#include <fmt/ranges.h>
#include <limits>

namespace {
arma::vec trim_both(const arma::vec &x, double proportion) {
    arma::vec sorted = arma::sort(x);
    auto cut = static_cast<arma::uword>(proportion * static_cast<double>(sorted.n_elem));
    return sorted.subvec(cut, sorted.n_elem - cut - 1);
}
}// namespace

const std::vector<std::string> LeveneTest::centers{"median", "mean", "trimmed"};

LeveneTest::LeveneTest(double threshold, const std::string &center)
    : centerid(check_centerid(center)), centername(center), threshold(check_threshold(threshold)) {}

LeveneTest::CenterID LeveneTest::check_centerid(const std::string &center) {
    auto ok = std::find(centers.cbegin(), centers.cend(), center);
    if (ok == centers.cend()) {
        throw(InvalidInputError(fmt::format("Unknown Levene centre '{}'. Options are: {}.", center, fmt::join(centers, ", "))));
    }

    if (center == "median") {
        return CenterID::Median;
    } else if (center == "mean") {
        return CenterID::Mean;
    } else {
        return CenterID::Trimmed;
    }
}

double LeveneTest::check_threshold(double threshold) {
    if (!(threshold > 0. && threshold < 1.)) {
        throw(InvalidInputError(fmt::format("Significance threshold must lie strictly between 0 and 1, got {}.", threshold)));
    }
    return threshold;
}

arma::vec LeveneTest::deviations(const Sample &s) const {
    switch (centerid) {
    case CenterID::Median:return arma::abs(s.data() - s.median());
    case CenterID::Mean:return arma::abs(s.data() - s.mean());
    case CenterID::Trimmed: {
        arma::vec trimmed = trim_both(s.data(), trim_proportion);
        return arma::abs(trimmed - arma::mean(trimmed));
    }
    default:return arma::vec();
    }
}

VarianceDecision LeveneTest::test(const Sample &a, const Sample &b) const {
    a.require_at_least(2);
    b.require_at_least(2);

    const double k = 2;
    arma::vec za = deviations(a);
    arma::vec zb = deviations(b);

    auto na = static_cast<double>(za.n_elem);
    auto nb = static_cast<double>(zb.n_elem);
    double N = na + nb;

    double mean_a = arma::mean(za);
    double mean_b = arma::mean(zb);
    double grand = (arma::accu(za) + arma::accu(zb)) / N;

    double between = na * std::pow(mean_a - grand, 2) + nb * std::pow(mean_b - grand, 2);
    double within = arma::accu(arma::square(za - mean_a)) + arma::accu(arma::square(zb - mean_b));
    if (!std::isfinite(between) || !std::isfinite(within)) {
        throw(InvalidInputError(fmt::format("Values in {} and {} are too large to compute Levene's test.", a.name(), b.name())));
    }

    VarianceDecision decision{};
    decision.threshold = threshold;
    decision.center = centername;

    if (within <= 0) {
        // Every deviation equals its group mean; the F ratio is 0/0 or x/0.
        if (between > 0) {
            decision.statistic = std::numeric_limits<double>::infinity();
            decision.p_value = 0;
        } else {
            decision.statistic = 0;
            decision.p_value = 1;
        }
    } else {
        decision.statistic = (N - k) / (k - 1) * between / within;
        if (std::isinf(decision.statistic)) {
            decision.p_value = 0;
        } else {
            boost::math::fisher_f dist(k - 1, N - k);
            decision.p_value = boost::math::cdf(boost::math::complement(dist, decision.statistic));
        }
    }
    decision.equal_variances = decision.p_value > threshold;

    return decision;
}

VarianceDecision test_equal_variances(const Sample &a,
                                      const Sample &b,
                                      double threshold,
                                      const std::string &center) {
    return LeveneTest(threshold, center).test(a, b);
}
