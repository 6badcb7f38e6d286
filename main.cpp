#include "src/analysis.hpp"
#include "src/commandline.hpp"
#include "src/errors.hpp"
#include "src/interactive.hpp"
#include "src/report.hpp"
#include "src/samplereader.hpp"
#include <armadillo>
#include <fmt/ostream.h>
#include <iostream>
#include <optional>

// Exactly one of a file path or an inline list is expected per sample.
static Sample load_sample(const std::optional<std::string> &path,
                          const std::optional<std::string> &values,
                          const std::string &name,
                          const std::string &flags,
                          bool verbose) {
  if (path) {
    if (verbose) {
      fmt::print(std::cerr, "Reading {} from {}.\n", name, *path);
    }
    return read_sample(*path, name);
  }
  if (values) {
    return Sample(name, parse_values(*values, name));
  }
  throw(InvalidInputError(fmt::format("No values given for {}. Use {}.", name, flags)));
}

int main(int argc, char *argv[]) {
  // C++ IO only
  std::ios_base::sync_with_stdio(false);

  arma::wall_clock timer;
  timer.tic();

  CommandLine cl;
  CLI11_PARSE(cl.app, argc, argv);
  cl.resolve();
  const Parameters &params = cl.params;

  if (params.verbose) {
    params.print(std::cerr);
  }

  try {
    if (params.command == "ttest") {
      Sample a = load_sample(params.input_a, params.values_a, "Sample 1", "-a/--sample-a or --values-a", params.verbose);
      Sample b = load_sample(params.input_b, params.values_b, "Sample 2", "-b/--sample-b or --values-b", params.verbose);

      TTestReport report = run_t_test(a, b, params.alpha, params.center);
      print_t_test_warnings(std::cerr, report);
      print_t_test(std::cout, report, params.verbose);
    } else if (params.command == "correlation") {
      Sample x = load_sample(params.input_a, params.values_a, "X (First Variable)", "-x/--sample-x or --values-x", params.verbose);
      Sample y = load_sample(params.input_b, params.values_b, "Y (Second Variable)", "-y/--sample-y or --values-y", params.verbose);

      CorrelationResult result = run_correlation(x, y);
      print_correlation(std::cout, result, params.verbose);
    } else {
      Interactive interactive(std::cin, std::cout, params);
      interactive.run();
    }
  } catch (InvalidInputError &e) {
    fmt::print(std::cerr, "Error: {}\n", e.what());
    return 1;
  } catch (DegenerateInputError &e) {
    fmt::print(std::cerr, "Error: {}\n", e.what());
    return 1;
  } catch (std::exception &e) {
    fmt::print(std::cerr, "Unexpected error: {}\n", e.what());
    return 1;
  }

  if (params.verbose) {
    fmt::print(std::cerr, "Total runtime: {}\n", timer.toc());
  }
  return 0;
}
