//
// Created by StatCalc contributors on 10/19/26.
//

#ifndef STATCALC_REPORT_HPP
#define STATCALC_REPORT_HPP

#include "analysis.hpp"
#include <ostream>

void print_t_test(std::ostream &os, const TTestReport &report, bool verbose);
void print_t_test_warnings(std::ostream &os, const TTestReport &report);
void print_correlation(std::ostream &os, const CorrelationResult &result, bool verbose);

#endif//STATCALC_REPORT_HPP
