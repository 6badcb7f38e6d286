//
// Created by StatCalc contributors on 10/19/26.
//

#include "commandline.hpp"
#include "levene.hpp"
#include <fmt/format.h>

const CLI::Validator OpenUnitInterval(
    [](std::string &input) -> std::string {
      double value = 0;
      if (!CLI::detail::lexical_cast(input, value)) {
        return fmt::format("Value {} could not be converted to a number", input);
      }
      if (!(value > 0. && value < 1.)) {
        return fmt::format("Value {} not in range (0, 1)", input);
      }
      return std::string();
    },
    "(0 - 1)",
    "OPEN UNIT INTERVAL");

CommandLine::CommandLine()
  : app{"StatCalc computes an independent two-sample t-test and Pearson's correlation coefficient. "
        "Run without a subcommand for the interactive calculator."} {
  app.require_subcommand(0, 1);

  app.add_flag("-v,--verbose",
			   params.verbose,
			   "Additional diagnostic output: Levene's test, means, standard error and p-values.");
  app.add_option("--alpha",
				 params.alpha,
				 "Significance threshold of Levene's test. Variances are treated as equal "
				 "when its p-value exceeds alpha. Default value of 0.05.")->default_val(0.05)->check(OpenUnitInterval);
  app.add_option("--center",
				 params.center,
				 "Centre used by Levene's test. Options are: median, mean, trimmed.")
	  ->default_val("median")->check(CLI::IsMember(LeveneTest::centers));

  ttest = app.add_subcommand("ttest", "Independent sample t-test. Levene's test selects the pooled or Welch formula.");
  ttest->fallthrough();
  auto ttest_a = ttest->add_option("-a,--sample-a",
				 params.input_a,
				 "File containing sample 1. Values separated by commas or whitespace, "
				 "# starts a comment line. May be gzip or zstd compressed. - reads stdin.");
  auto ttest_b = ttest->add_option("-b,--sample-b",
				 params.input_b,
				 "File containing sample 2.");
  ttest->add_option("--values-a",
				 params.values_a,
				 "Sample 1 as an inline comma-separated list, e.g. \"2,4,4,5\".")->excludes(ttest_a);
  ttest->add_option("--values-b",
				 params.values_b,
				 "Sample 2 as an inline comma-separated list.")->excludes(ttest_b);

  correlation = app.add_subcommand("correlation", "Pearson's correlation coefficient of paired samples.");
  correlation->fallthrough();
  auto corr_x = correlation->add_option("-x,--sample-x",
				 params.input_a,
				 "File containing the first variable.");
  auto corr_y = correlation->add_option("-y,--sample-y",
				 params.input_b,
				 "File containing the second variable. Must hold as many values as the first.");
  correlation->add_option("--values-x",
				 params.values_a,
				 "First variable as an inline comma-separated list.")->excludes(corr_x);
  correlation->add_option("--values-y",
				 params.values_b,
				 "Second variable as an inline comma-separated list.")->excludes(corr_y);
}

void CommandLine::resolve() {
  if (ttest->parsed()) {
    params.command = "ttest";
  } else if (correlation->parsed()) {
    params.command = "correlation";
  } else {
    params.command.clear();
  }
}
