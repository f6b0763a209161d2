#include "brinksmanship/BatchRunner.hpp"

#include "util/BoostUtil.hpp"

namespace brinksmanship {

inline auto BatchRunner::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("BatchRunner options");

  return desc
    .template add_option<"num-games", 'G'>(po::value<int>(&num_games)->default_value(num_games),
                                           "num games per pairing")
    .template add_option<"num-threads", 't'>(
      po::value<int>(&num_threads)->default_value(num_threads),
      "num threads to use for running games")
    .template add_option<"policy-a">(po::value<std::string>(&policy_a)->default_value(policy_a),
                                     "policy for player A")
    .template add_option<"policy-b">(po::value<std::string>(&policy_b)->default_value(policy_b),
                                     "policy for player B")
    .template add_option<"all-pairings">(
      po::bool_switch(&all_pairings)->default_value(all_pairings),
      "run every pairing of the built-in policies (ignores --policy-a/--policy-b)")
    .template add_hidden_option<"max-turns">(
      po::value<int>(&max_turns)->default_value(max_turns),
      "game length, clamped to [12, 16] (0 means random per game)")
    .template add_option<"output-json">(
      po::value<std::string>(&output_json)->default_value(output_json),
      "if set, write the JSON report to this file");
}

}  // namespace brinksmanship
