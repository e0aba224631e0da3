#include "training/HeuristicTuner.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace training {

inline auto HeuristicTuner::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Tuner options");

  return desc
    .template add_option<"iterations">(po::value<int>(&iterations)->default_value(iterations),
                                       "maximum number of hill-climbing iterations")
    .template add_option<"patience">(po::value<int>(&patience)->default_value(patience),
                                     "stop after this many iterations without improvement")
    .template add_option<"noise">(po2::default_value("{:.2f}", &noise),
                                  "relative size of the perturbation of each weight")
    .template add_option<"perturb-prob">(po2::default_value("{:.2f}", &perturb_prob),
                                         "probability that a given weight is perturbed")
    .template add_option<"games-per-match">(
      po::value<int>(&games_per_match)->default_value(games_per_match),
      "games played between champion and challenger")
    .template add_option<"tuner-move-time-ms">(
      po::value<int>(&move_time_ms)->default_value(move_time_ms),
      "per-move think time during tuning matches")
    .template add_option<"fixed-features">(
      po::value<std::string>(&fixed_features)->default_value(fixed_features),
      "comma-separated features whose weight is never perturbed");
}

}  // namespace training
