#include "dc3/Heuristics.hpp"

#include "util/Exception.hpp"
#include "util/StringUtil.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cmath>

namespace dc3 {

score_t Evaluator::evaluate(const Position& position, const Geometry& geometry) const {
  seat_index_t winner = Rules::get_winner(position, geometry);
  if (winner != kNoSeat) {
    return winner == kWhite ? kWinScore : -kWinScore;
  }
  if (Rules::count_moves(position, geometry, position.side_to_move) == 0) {
    return position.side_to_move == kWhite ? -kWinScore : kWinScore;
  }

  FeatureVector features = compute_features(position, geometry);
  double dot = 0;
  for (int f = 0; f < kNumFeatures; ++f) {
    dot += features[f] * weights_[f];
  }

  double scaled = std::round(100 * dot);
  double limit = kMinWinScore - 1;
  return score_t(std::clamp(scaled, -limit, limit));
}

FeatureVector Evaluator::compute_features(const Position& position, const Geometry& geometry) {
  FeatureVector features = {};
  add_side_features(position, geometry, kWhite, 1.0, features);
  add_side_features(position, geometry, kBlack, -1.0, features);
  features[kTempo] = position.side_to_move == kWhite ? 1 : -1;
  return features;
}

void Evaluator::add_side_features(const Position& position, const Geometry& geometry,
                                  seat_index_t seat, double sign, FeatureVector& features) {
  mask_t own = position.pieces[seat];
  mask_t opp = position.pieces[opponent_of(seat)];
  mask_t empty = ~position.occupied();

  int runs = 0;
  for (mask_t run : geometry.two_run_masks()) {
    if ((run & own) == run) ++runs;
  }

  double distance = 0;
  for (mask_t m = own; m; m &= m - 1) {
    distance += geometry.center_distance(std::countr_zero(m));
  }

  int blocked = 0;
  int threats = 0;
  for (mask_t line : geometry.winning_masks()) {
    int n_own = std::popcount(line & own);
    int n_opp = std::popcount(line & opp);
    if (n_opp == 2 && n_own == 1) ++blocked;
    if (n_own == 2 && n_opp == 0) {
      int target = std::countr_zero(line & empty);
      for (mask_t m = own & ~line; m; m &= m - 1) {
        if (geometry.neighbors(std::countr_zero(m)) & (mask_t(1) << target)) {
          ++threats;
          break;
        }
      }
    }
  }

  features[kRunsOfTwo] += sign * runs;
  features[kCenterDistance] -= sign * distance;
  features[kMobility] += sign * Rules::count_moves(position, geometry, seat);
  features[kBlockedLines] += sign * blocked;
  features[kThreats] += sign * threats;
}

const char* Evaluator::feature_name(Feature feature) {
  switch (feature) {
    case kRunsOfTwo:
      return "runs-of-two";
    case kCenterDistance:
      return "center-distance";
    case kMobility:
      return "mobility";
    case kBlockedLines:
      return "blocked-lines";
    case kThreats:
      return "threats";
    case kTempo:
      return "tempo";
    default:
      throw util::Exception("Unknown feature {}", int(feature));
  }
}

std::string Evaluator::weights_to_str(const WeightVector& weights) {
  return fmt::format("{}", fmt::join(weights, ","));
}

WeightVector Evaluator::parse_weights(const std::string& str) {
  std::vector<std::string> tokens = util::split(str, ",");
  if (tokens.size() != kNumFeatures) {
    throw util::CleanException("Expected {} comma-separated weights, got \"{}\"", int(kNumFeatures),
                               str);
  }
  WeightVector weights;
  for (int f = 0; f < kNumFeatures; ++f) {
    weights[f] = util::atof_safe(tokens[f]);
  }
  return weights;
}

}  // namespace dc3
