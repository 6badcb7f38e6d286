//
// Created by StatCalc contributors on 10/19/26.
//

#include "sample.hpp"
#include "errors.hpp"
#include <cmath>
#include <fmt/format.h>
#include <utility>

Sample::Sample(std::string name, arma::vec data)
    : name_(std::move(name)), data_(std::move(data)) {
    validate();
}

Sample::Sample(std::string name, const std::vector<double> &data)
    : name_(std::move(name)), data_(data) {
    validate();
}

void Sample::validate() const {
    for (arma::uword i = 0; i < data_.n_elem; i++) {
        if (!std::isfinite(data_(i))) {
            throw(InvalidInputError(fmt::format("{} contains a non-finite value at position {}.", name_, i + 1)));
        }
    }
}

void Sample::require_at_least(arma::uword n) const {
    if (data_.n_elem < n) {
        throw(InvalidInputError(fmt::format("{} must contain at least {} values, but has {}.", name_, n, data_.n_elem)));
    }
}

double Sample::mean() const {
    require_at_least(1);
    return arma::mean(data_);
}

double Sample::variance() const {
    require_at_least(2);
    return arma::var(data_); // Normalized by n - 1
}

double Sample::standard_deviation() const {
    return std::sqrt(variance());
}

double Sample::median() const {
    require_at_least(1);
    return arma::median(data_);
}
