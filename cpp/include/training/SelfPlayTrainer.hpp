#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/GameRecord.hpp"
#include "core/GameRunner.hpp"
#include "dc3/Board.hpp"
#include "dc3/Heuristics.hpp"
#include "search/TranspositionTable.hpp"
#include "training/OutcomeLearner.hpp"

#include <atomic>
#include <string>

namespace training {

/*
 * Plays two agents against each other indefinitely, swapping colours every game, and feeds each
 * finished game to an OutcomeLearner over the shared table.
 *
 * When the agents draw stalemate_threshold games in a row, the per-move budget grows by
 * budget_increment_ms, up to max_budget_ms, and the streak restarts. A decisive game also
 * restarts it.
 *
 * Every checkpoint_interval games, and when run() returns, the table is flushed and the counters
 * are written to the checkpoint file. A trainer constructed with an existing checkpoint resumes
 * from its counters.
 */
class SelfPlayTrainer {
 public:
  struct Params {
    auto make_options_description();

    int stalemate_threshold = 5;
    int initial_budget_ms = 1000;
    int budget_increment_ms = 1000;
    int max_budget_ms = 60000;
    int checkpoint_interval = 1;
    std::string checkpoint_filename;  // empty: no checkpoint
    int max_games = 0;                // 0: until stop()
  };

  struct Counters {
    bool operator==(const Counters&) const = default;
    std::string to_str() const;

    int games = 0;
    int decisive = 0;
    int draws = 0;
    int aborted = 0;
    int consecutive_draws = 0;
    int budget_increases = 0;
    int budget_ms = 0;
  };

  using player_array_t = core::AbstractPlayer::player_array_t;

  /*
   * agents[0] plays white in even-numbered games. The agents, table and evaluator must outlive
   * the trainer.
   */
  SelfPlayTrainer(const Params& params, const core::GameRunner::Params& runner_params,
                  const OutcomeLearner::Params& learner_params, search::TranspositionTable& table,
                  const dc3::Evaluator& evaluator, const dc3::Board& initial,
                  const player_array_t& agents);

  // Plays games until stop() is called or max_games games have been played in total.
  void run();

  // Plays and learns from a single game.
  core::GameRecord play_one_game();

  // Can be called from a signal handler or another thread. run() returns after the current game.
  void stop() { stop_requested_ = true; }

  void checkpoint();
  const Counters& counters() const { return counters_; }

 private:
  void update_counters(const core::GameRecord& record);
  void load_checkpoint();

  const Params params_;
  const core::GameRunner runner_;
  OutcomeLearner learner_;
  search::TranspositionTable& table_;
  const dc3::Board initial_;
  const player_array_t agents_;

  Counters counters_;
  std::atomic<bool> stop_requested_ = false;
};

}  // namespace training

#include "inline/training/SelfPlayTrainer.inl"
