#include "brinksmanship/BatchRunner.hpp"
#include "brinksmanship/Constants.hpp"
#include "brinksmanship/Scenario.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/program_options.hpp>

#include <format>
#include <iostream>
#include <string>
#include <vector>

struct Args {
  std::string scenario_filename;

  auto make_options_description() {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    po2::options_description desc("Program options");

    return desc.template add_option<"scenario">(
      po::value<std::string>(&scenario_filename)->default_value(scenario_filename),
      "scenario JSON file (default: a linear prisoner's dilemma scenario)");
  }
};

void print_summary(const std::vector<brinksmanship::PairingStats>& all_stats) {
  std::cout << std::format("{:<14} {:<14} {:>6} {:>6} {:>6} {:>6} {:>7} {:>7} {:>6} {:>6}\n",
                           "policy_a", "policy_b", "games", "A%", "B%", "tie%", "avg_a",
                           "avg_b", "MD%", "elim%");
  for (const auto& s : all_stats) {
    double n = s.total_games();
    std::cout << std::format(
      "{:<14} {:<14} {:>6} {:>6.1f} {:>6.1f} {:>6.1f} {:>7.1f} {:>7.1f} {:>6.1f} {:>6.1f}\n",
      s.policy_a(), s.policy_b(), s.total_games(), 100 * s.wins_a() / n, 100 * s.wins_b() / n,
      100 * s.ties() / n, s.avg_total_a(), s.avg_total_b(), 100 * s.mutual_destruction_rate(),
      100 * s.elimination_rate());
  }
}

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;
    namespace bm = brinksmanship;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    bm::BatchRunner::Params batch_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(batch_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      std::cout << "Policies: " << util::grammatically_join(bm::policies::names(), "and")
                << std::endl;
      return 0;
    }

    util::Logging::init(log_params);

    bm::Scenario scenario =
      args.scenario_filename.empty()
        ? bm::Scenario::make_linear("Default", bm::MatrixType::kPrisonersDilemma, bm::kMaxMaxTurns)
        : bm::Scenario::load(args.scenario_filename);
    LOG_INFO("Loaded scenario '{}' ({} turn configurations)", scenario.name(),
             scenario.num_turns());

    bm::BatchRunner runner(scenario, batch_params, random_params.seed);
    std::vector<bm::PairingStats> stats = runner.run();
    print_summary(stats);

    if (!batch_params.output_json.empty()) {
      boost_util::write_str_to_file(boost_util::pretty_print(runner.report(stats)),
                                    batch_params.output_json);
      LOG_INFO("Wrote report to {}", batch_params.output_json);
    }
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }

  return 0;
}
