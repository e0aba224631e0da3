#pragma once

#include "core/GameRunner.hpp"
#include "dc3/Board.hpp"
#include "dc3/Heuristics.hpp"
#include "search/Engine.hpp"

#include <functional>
#include <random>
#include <string>
#include <vector>

namespace training {

/*
 * Hill climber over evaluator weights.
 *
 * Each iteration perturbs a copy of the champion and plays a match between the two. The
 * challenger replaces the champion only if it wins strictly more games than it loses, so the
 * champion never changes on a drawn or lost match. The climb stops after `iterations`
 * iterations, or after `patience` consecutive iterations without a replacement.
 *
 * The match is an injectable function. make_tournament() builds the engine-vs-engine one.
 */
class HeuristicTuner {
 public:
  struct Params {
    auto make_options_description();

    // Weights not in fixed_features are perturbed.
    std::vector<dc3::Feature> get_fixed_features() const;

    int iterations = 100;
    int patience = 20;
    double noise = 0.25;
    double perturb_prob = 1.0;
    int games_per_match = 2;
    int move_time_ms = 200;
    std::string fixed_features;  // comma-separated feature names, e.g. "tempo,mobility"
  };

  struct MatchResult {
    bool challenger_won() const { return challenger_wins > champion_wins; }
    std::string to_str() const;

    int champion_wins = 0;
    int challenger_wins = 0;
    int draws = 0;
  };

  struct Step {
    dc3::WeightVector champion;  // before the match
    dc3::WeightVector challenger;
    MatchResult result;
  };

  using tournament_t =
    std::function<MatchResult(const dc3::WeightVector& champion,
                              const dc3::WeightVector& challenger)>;

  HeuristicTuner(const Params& params, const dc3::WeightVector& initial,
                 const tournament_t& tournament, int seed);

  // Climbs and returns the final champion.
  dc3::WeightVector run();

  dc3::WeightVector perturb(const dc3::WeightVector& weights);

  const dc3::WeightVector& champion() const { return champion_; }
  const std::vector<Step>& history() const { return history_; }

  /*
   * Engine-vs-engine match of params.games_per_match games from initial, with colours
   * alternating. Each engine searches with its own in-memory table.
   */
  static tournament_t make_tournament(const Params& params,
                                      const search::Engine::Params& engine_params,
                                      const core::GameRunner::Params& runner_params,
                                      const dc3::Board& initial);

 private:
  const Params params_;
  const tournament_t tournament_;
  std::vector<bool> fixed_;
  std::mt19937 prng_;
  dc3::WeightVector champion_;
  std::vector<Step> history_;
};

}  // namespace training

#include "inline/training/HeuristicTuner.inl"
