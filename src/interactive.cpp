//
// Created by StatCalc contributors on 10/19/26.
//

#include "interactive.hpp"
#include "analysis.hpp"
#include "errors.hpp"
#include "report.hpp"
#include "samplereader.hpp"
#include <boost/algorithm/string/trim.hpp>
#include <fmt/ostream.h>
#include <utility>

Interactive::Interactive(std::istream &in_, std::ostream &out_, Parameters params_)
    : in(in_), out(out_), params(std::move(params_)) {}

std::optional<std::vector<double>> Interactive::get_sample_input(const std::string &sample_name) {
    std::string line;
    while (true) {
        fmt::print(out, "Enter numbers for {}, separated by commas: ", sample_name);
        out.flush();
        if (!std::getline(in, line)) {
            return std::nullopt;
        }
        try {
            auto values = parse_values(line, sample_name);
            if (!values.empty()) {
                return values;
            }
        } catch (InvalidInputError &e) {
            if (params.verbose) {
                fmt::print(out, "{}\n", e.what());
            }
        }
        fmt::print(out, "Invalid input. Please enter numbers separated by commas.\n");
    }
}

void Interactive::t_test() {
    fmt::print(out, "\nIndependent Sample T-Test Calculator\n");
    auto sample1 = get_sample_input("Sample 1");
    if (!sample1) {
        return;
    }
    auto sample2 = get_sample_input("Sample 2");
    if (!sample2) {
        return;
    }
    try {
        TTestReport report = run_t_test(Sample("Sample 1", *sample1),
                                        Sample("Sample 2", *sample2),
                                        params.alpha,
                                        params.center);
        print_t_test_warnings(out, report);
        print_t_test(out, report, params.verbose);
    } catch (InvalidInputError &e) {
        fmt::print(out, "Error: {}\n", e.what());
    } catch (DegenerateInputError &e) {
        fmt::print(out, "Error: {}\n", e.what());
    }
}

void Interactive::correlation() {
    fmt::print(out, "\nPearson's Correlation Coefficient Calculator\n");
    auto first_variable = get_sample_input("X (First Variable)");
    if (!first_variable) {
        return;
    }
    auto second_variable = get_sample_input("Y (Second Variable)");
    if (!second_variable) {
        return;
    }
    try {
        CorrelationResult result = run_correlation(Sample("X (First Variable)", *first_variable),
                                                   Sample("Y (Second Variable)", *second_variable));
        print_correlation(out, result, params.verbose);
    } catch (InvalidInputError &e) {
        fmt::print(out, "Error: {}\n", e.what());
    } catch (DegenerateInputError &e) {
        fmt::print(out, "Error: {}\n", e.what());
    }
}

void Interactive::run() {
    fmt::print(out, "Welcome to the Statistics Calculator\n");
    std::string line;
    while (true) {
        fmt::print(out, "\nOptions\n");
        fmt::print(out, "1: Independent Sample T Test Calculator\n");
        fmt::print(out, "2: Pearson's Correlation Coefficient Calculator\n");
        fmt::print(out, "3: Exit\n");
        fmt::print(out, "Enter your choice (1, 2, or 3): ");
        out.flush();
        if (!std::getline(in, line)) {
            fmt::print(out, "\n");
            break;
        }
        std::string choice = boost::trim_copy(line);
        if (choice == "1") {
            t_test();
        } else if (choice == "2") {
            correlation();
        } else if (choice == "3") {
            fmt::print(out, "Thank you for using the Statistics Calculator. Goodbye!\n");
            break;
        } else {
            fmt::print(out, "Invalid choice. Please enter 1, 2, or 3.\n");
        }
        if (!in) {
            break;
        }
    }
}
