#include "training/HeuristicTuner.hpp"

#include "core/GameRecord.hpp"
#include "generic_players/EnginePlayer.hpp"
#include "search/TranspositionTable.hpp"
#include "util/Asserts.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"
#include "util/StringUtil.hpp"

#include <boost/algorithm/string.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>
#include <cmath>

namespace training {

std::vector<dc3::Feature> HeuristicTuner::Params::get_fixed_features() const {
  std::vector<dc3::Feature> features;
  if (fixed_features.empty()) return features;

  for (std::string token : util::split(fixed_features, ",")) {
    boost::algorithm::trim(token);
    bool found = false;
    for (int f = 0; f < dc3::kNumFeatures; ++f) {
      if (token == dc3::Evaluator::feature_name(dc3::Feature(f))) {
        features.push_back(dc3::Feature(f));
        found = true;
      }
    }
    if (!found) {
      throw util::CleanException("Unknown feature \"{}\" in --fixed-features", token);
    }
  }
  return features;
}

std::string HeuristicTuner::MatchResult::to_str() const {
  return fmt::format("champion {} - challenger {} ({} drawn)", champion_wins, challenger_wins,
                     draws);
}

HeuristicTuner::HeuristicTuner(const Params& params, const dc3::WeightVector& initial,
                               const tournament_t& tournament, int seed)
    : params_(params),
      tournament_(tournament),
      fixed_(dc3::kNumFeatures, false),
      prng_(seed),
      champion_(initial) {
  CLEAN_ASSERT(params.noise > 0, "--noise must be positive");
  CLEAN_ASSERT(params.perturb_prob >= 0 && params.perturb_prob <= 1,
               "--perturb-prob must be in [0, 1]");
  for (dc3::Feature f : params.get_fixed_features()) {
    fixed_[f] = true;
  }
}

dc3::WeightVector HeuristicTuner::perturb(const dc3::WeightVector& weights) {
  dc3::WeightVector out = weights;
  for (int f = 0; f < dc3::kNumFeatures; ++f) {
    if (fixed_[f]) continue;
    if (util::Random::uniform_real(prng_, 0.0, 1.0) >= params_.perturb_prob) continue;
    double scale = std::max(std::abs(weights[f]), 1.0);
    double delta = util::Random::uniform_real(prng_, -params_.noise, params_.noise) * scale;
    out[f] = std::max(0.0, weights[f] + delta);
  }
  return out;
}

dc3::WeightVector HeuristicTuner::run() {
  int stale = 0;
  for (int i = 0; i < params_.iterations && stale < params_.patience; ++i) {
    dc3::WeightVector challenger = perturb(champion_);
    MatchResult result = tournament_(champion_, challenger);
    history_.push_back({champion_, challenger, result});

    if (result.challenger_won()) {
      champion_ = challenger;
      stale = 0;
      LOG_INFO("Iteration {}: {}, new champion {}", i, result.to_str(),
               dc3::Evaluator::weights_to_str(champion_));
    } else {
      stale++;
      LOG_INFO("Iteration {}: {}, champion kept", i, result.to_str());
    }
  }
  LOG_INFO("Tuning finished after {} iterations: {}", history_.size(),
           dc3::Evaluator::weights_to_str(champion_));
  return champion_;
}

HeuristicTuner::tournament_t HeuristicTuner::make_tournament(
  const Params& params, const search::Engine::Params& engine_params,
  const core::GameRunner::Params& runner_params, const dc3::Board& initial) {
  return [=](const dc3::WeightVector& champion, const dc3::WeightVector& challenger) {
    MatchResult result;
    search::TranspositionTable::Params table_params;  // in-memory
    const dc3::Evaluator annotator;
    core::GameRunner runner(runner_params, annotator);

    for (int g = 0; g < params.games_per_match; ++g) {
      search::TranspositionTable champion_table(table_params, initial.geometry());
      search::TranspositionTable challenger_table(table_params, initial.geometry());
      generic::EnginePlayer champion_player(engine_params, champion_table, champion);
      generic::EnginePlayer challenger_player(engine_params, challenger_table, challenger);
      champion_player.set_name("champion");
      challenger_player.set_name("challenger");

      // The challenger plays white in even-numbered games.
      dc3::seat_index_t challenger_seat = g % 2 == 0 ? dc3::kWhite : dc3::kBlack;
      core::GameRunner::player_array_t players;
      players[challenger_seat] = &challenger_player;
      players[dc3::opponent_of(challenger_seat)] = &champion_player;

      core::GameRecord record =
        runner.play(initial, players, std::chrono::milliseconds(params.move_time_ms));
      if (!record.decisive()) {
        result.draws++;
      } else if (record.winner() == challenger_seat) {
        result.challenger_wins++;
      } else {
        result.champion_wins++;
      }
    }
    return result;
  };
}

}  // namespace training
