#include "training/SelfPlayTrainer.hpp"

#include "util/Asserts.hpp"
#include "util/Config.hpp"
#include "util/LoggingUtil.hpp"
#include "util/StringUtil.hpp"

#include <boost/filesystem.hpp>
#include <fmt/format.h>

#include <algorithm>
#include <chrono>

namespace training {

std::string SelfPlayTrainer::Counters::to_str() const {
  return fmt::format(
    "games={} decisive={} draws={} aborted={} consecutive_draws={} budget_ms={} "
    "budget_increases={}",
    games, decisive, draws, aborted, consecutive_draws, budget_ms, budget_increases);
}

SelfPlayTrainer::SelfPlayTrainer(const Params& params,
                                 const core::GameRunner::Params& runner_params,
                                 const OutcomeLearner::Params& learner_params,
                                 search::TranspositionTable& table,
                                 const dc3::Evaluator& evaluator, const dc3::Board& initial,
                                 const player_array_t& agents)
    : params_(params),
      runner_(runner_params, evaluator),
      learner_(learner_params, table),
      table_(table),
      initial_(initial),
      agents_(agents) {
  CLEAN_ASSERT(params.stalemate_threshold > 0, "--stalemate-threshold must be positive");
  CLEAN_ASSERT(params.initial_budget_ms > 0, "--move-time-ms must be positive");
  counters_.budget_ms = params.initial_budget_ms;
  load_checkpoint();
}

void SelfPlayTrainer::run() {
  LOG_INFO("Self-play starting: {}", counters_.to_str());
  while (!stop_requested_ && (params_.max_games <= 0 || counters_.games < params_.max_games)) {
    play_one_game();
  }
  checkpoint();
  LOG_INFO("Self-play stopped: {}", counters_.to_str());
}

core::GameRecord SelfPlayTrainer::play_one_game() {
  player_array_t seats = agents_;
  if (counters_.games % 2 == 1) std::swap(seats[0], seats[1]);

  core::GameRecord record =
    runner_.play(initial_, seats, std::chrono::milliseconds(counters_.budget_ms));
  if (record.finished()) {
    learner_.learn(record);
  }
  update_counters(record);

  if (params_.checkpoint_interval > 0 && counters_.games % params_.checkpoint_interval == 0) {
    checkpoint();
  }
  return record;
}

void SelfPlayTrainer::update_counters(const core::GameRecord& record) {
  counters_.games++;
  if (record.decisive()) {
    counters_.decisive++;
    counters_.consecutive_draws = 0;
  } else if (record.result == core::kDraw) {
    counters_.draws++;
    counters_.consecutive_draws++;
    if (counters_.consecutive_draws >= params_.stalemate_threshold) {
      int budget = std::min(counters_.budget_ms + params_.budget_increment_ms,
                            std::max(params_.max_budget_ms, counters_.budget_ms));
      LOG_INFO("{} consecutive draws, move budget {} -> {} ms", counters_.consecutive_draws,
               counters_.budget_ms, budget);
      counters_.budget_ms = budget;
      counters_.budget_increases++;
      counters_.consecutive_draws = 0;
    }
  } else {
    counters_.aborted++;
  }
  LOG_INFO("Game {}: {} | {}", counters_.games, record.to_str(), counters_.to_str());
}

void SelfPlayTrainer::checkpoint() {
  table_.flush();
  if (params_.checkpoint_filename.empty()) return;

  util::Config config;
  config.set("games", std::to_string(counters_.games));
  config.set("decisive", std::to_string(counters_.decisive));
  config.set("draws", std::to_string(counters_.draws));
  config.set("aborted", std::to_string(counters_.aborted));
  config.set("consecutive_draws", std::to_string(counters_.consecutive_draws));
  config.set("budget_increases", std::to_string(counters_.budget_increases));
  config.set("budget_ms", std::to_string(counters_.budget_ms));
  config.save(params_.checkpoint_filename);
  LOG_DEBUG("Checkpoint written to {}", params_.checkpoint_filename);
}

void SelfPlayTrainer::load_checkpoint() {
  if (params_.checkpoint_filename.empty()) return;
  if (!boost::filesystem::exists(params_.checkpoint_filename)) return;

  util::Config config(params_.checkpoint_filename);
  auto get = [&](const char* key, int default_value) {
    return util::atoi_safe(config.get(key, std::to_string(default_value)));
  };
  counters_.games = get("games", 0);
  counters_.decisive = get("decisive", 0);
  counters_.draws = get("draws", 0);
  counters_.aborted = get("aborted", 0);
  counters_.consecutive_draws = get("consecutive_draws", 0);
  counters_.budget_increases = get("budget_increases", 0);
  counters_.budget_ms = get("budget_ms", counters_.budget_ms);
  LOG_INFO("Resumed from checkpoint {}: {}", params_.checkpoint_filename, counters_.to_str());
}

}  // namespace training
