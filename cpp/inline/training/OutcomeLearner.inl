#include "training/OutcomeLearner.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace training {

inline auto OutcomeLearner::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Outcome learner options");

  return desc
    .template add_option<"threshold-loss">(
      po::value<int>(&threshold_loss)->default_value(threshold_loss),
      "evaluation at or above which a lost game counts as a misjudgement")
    .template add_option<"threshold-draw">(
      po::value<int>(&threshold_draw)->default_value(threshold_draw),
      "evaluation at or above which a drawn game counts as a misjudgement")
    .template add_option<"target-loss">(po::value<int>(&target_loss)->default_value(target_loss),
                                        "evaluation a lost position is pulled towards (negated)")
    .template add_option<"learning-rate">(po2::default_value("{:.2f}", &learning_rate),
                                          "fraction of the error corrected per game")
    .template add_option<"neighbor-plies">(
      po::value<int>(&neighbor_plies)->default_value(neighbor_plies),
      "number of earlier plies by the same side that share the correction")
    .template add_option<"neighbor-decay">(po2::default_value("{:.2f}", &neighbor_decay),
                                           "per-ply decay of the shared correction");
}

inline bool OutcomeLearner::disagrees(dc3::score_t v, int outcome) const {
  if (outcome < 0) return v >= params_.threshold_loss;
  if (outcome == 0) return v >= params_.threshold_draw;
  return false;
}

}  // namespace training
