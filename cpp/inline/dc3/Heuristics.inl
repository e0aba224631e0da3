#include "dc3/Heuristics.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace dc3 {

inline auto Evaluator::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Evaluator options");

  return desc.template add_option<"weights", 'w'>(
    po::value<std::string>(&weights)->default_value(weights),
    "comma-separated heuristic weights, in the order runs-of-two, center-distance, mobility, "
    "blocked-lines, threats, tempo (default: 1,5,0.1,10,25,0.5)");
}

inline WeightVector Evaluator::Params::get_weights() const {
  if (weights.empty()) return kDefaultWeights;
  return parse_weights(weights);
}

inline score_t Evaluator::evaluate_for_side_to_move(const Position& position,
                                                    const Geometry& geometry) const {
  score_t score = evaluate(position, geometry);
  return position.side_to_move == kWhite ? score : -score;
}

}  // namespace dc3
