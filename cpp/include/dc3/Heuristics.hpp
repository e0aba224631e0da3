#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Position.hpp"

#include <array>
#include <string>

namespace dc3 {

enum Feature : int8_t {
  kRunsOfTwo,
  kCenterDistance,
  kMobility,
  kBlockedLines,
  kThreats,
  kTempo,
  kNumFeatures
};

using FeatureVector = std::array<double, kNumFeatures>;
using WeightVector = std::array<double, kNumFeatures>;

/*
 * Static evaluation: a weighted sum of independent features, each computed as white's value minus
 * black's, so positive scores favour white.
 *
 * - kRunsOfTwo: length-2 segments of a line that are fully owned.
 * - kCenterDistance: black's summed Chebyshev distance to the centre minus white's.
 * - kMobility: number of moves available.
 * - kBlockedLines: winning lines where the opponent has two cells and the side holds the third.
 * - kThreats: winning lines with two own pieces whose empty third cell an own piece outside the
 *   line can reach in one move.
 * - kTempo: +1 if white is to move, -1 otherwise.
 *
 * The score is round(100 * dot(features, weights)), clamped strictly inside +/-kMinWinScore. A won
 * position scores +/-kWinScore, and a position where the side to move has no move is a loss for
 * that side.
 */
class Evaluator {
 public:
  struct Params {
    auto make_options_description();
    WeightVector get_weights() const;

    std::string weights;  // comma-separated; empty means kDefaultWeights
  };

  static constexpr WeightVector kDefaultWeights = {1.0, 5.0, 0.1, 10.0, 25.0, 0.5};

  explicit Evaluator(const WeightVector& weights = kDefaultWeights) : weights_(weights) {}

  const WeightVector& weights() const { return weights_; }

  // Score from white's point of view.
  score_t evaluate(const Position& position, const Geometry& geometry) const;

  // Score from the point of view of the side to move, as the search consumes it.
  score_t evaluate_for_side_to_move(const Position& position, const Geometry& geometry) const;

  static FeatureVector compute_features(const Position& position, const Geometry& geometry);

  static const char* feature_name(Feature feature);

  // "1,5,0.1,10,25,0.5" <-> WeightVector. parse_weights() throws util::CleanException.
  static std::string weights_to_str(const WeightVector& weights);
  static WeightVector parse_weights(const std::string& str);

 private:
  // Per-seat value of every feature except kTempo.
  static void add_side_features(const Position& position, const Geometry& geometry,
                                seat_index_t seat, double sign, FeatureVector& features);

  WeightVector weights_;
};

}  // namespace dc3

#include "inline/dc3/Heuristics.inl"
