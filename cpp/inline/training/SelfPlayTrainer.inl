#include "training/SelfPlayTrainer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace training {

inline auto SelfPlayTrainer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Self-play options");

  return desc
    .template add_option<"stalemate-threshold">(
      po::value<int>(&stalemate_threshold)->default_value(stalemate_threshold),
      "consecutive draws after which the move budget grows")
    .template add_option<"move-time-ms", 'm'>(
      po::value<int>(&initial_budget_ms)->default_value(initial_budget_ms),
      "per-move think time in milliseconds (initial value when training)")
    .template add_option<"budget-increment-ms">(
      po::value<int>(&budget_increment_ms)->default_value(budget_increment_ms),
      "amount the move budget grows by after a stalemate streak")
    .template add_option<"max-budget-ms">(
      po::value<int>(&max_budget_ms)->default_value(max_budget_ms), "cap on the move budget")
    .template add_option<"checkpoint-interval">(
      po::value<int>(&checkpoint_interval)->default_value(checkpoint_interval),
      "games between checkpoints (0: only on shutdown)")
    .template add_option<"checkpoint-filename">(
      po::value<std::string>(&checkpoint_filename)->default_value(checkpoint_filename),
      "trainer counters are saved to and resumed from this file")
    .template add_option<"num-games", 'G'>(po::value<int>(&max_games)->default_value(max_games),
                                           "stop after this many games in total (0: never)");
}

}  // namespace training
