#pragma once

#include "core/GameRecord.hpp"
#include "dc3/Constants.hpp"
#include "search/TranspositionTable.hpp"

#include <string>
#include <vector>

namespace training {

/*
 * After a game, finds the ply that most likely caused a loss or a draw and biases the table at the
 * position it led to.
 *
 * Scanning back from the last ply, a ply is a disagreement if the static evaluation after it,
 * seen from the mover, was optimistic about a game the mover went on to lose (v >= threshold_loss)
 * or draw (v >= threshold_draw). Won games never disagree. The latest such ply is corrected: the
 * mover's view of the position is pulled towards a target value (-target_loss for a loss, 0 for a
 * draw) by learning_rate, and optionally the neighbor_plies previous plies by the same mover get
 * the same correction scaled by neighbor_decay^k.
 *
 * This is an attribution heuristic. The correction only shifts heuristic scores; proven scores
 * are never produced by it.
 */
class OutcomeLearner {
 public:
  struct Params {
    auto make_options_description();

    int threshold_loss = 100;
    int threshold_draw = 300;
    int target_loss = 500;
    double learning_rate = 0.5;
    int neighbor_plies = 0;
    double neighbor_decay = 0.5;
  };

  struct Correction {
    std::string to_str() const;

    int ply;  // index into GameRecord::plies
    dc3::fingerprint_t fingerprint;
    dc3::score_t delta;  // added to the bias, from the point of view of the side to move
  };
  using correction_vec_t = std::vector<Correction>;

  OutcomeLearner(const Params& params, search::TranspositionTable& table);

  // Applies and flushes the corrections for record. Aborted games yield no corrections.
  correction_vec_t learn(const core::GameRecord& record);

  // Index of the latest disagreeing ply, or -1.
  int find_disagreement(const core::GameRecord& record) const;

  // v is the mover's view of the evaluation after its move; outcome is +1/0/-1 for the mover.
  bool disagrees(dc3::score_t v, int outcome) const;

  const Params& params() const { return params_; }

 private:
  static dc3::score_t mover_view(const core::GameRecord& record, int ply);

  const Params params_;
  search::TranspositionTable& table_;
};

}  // namespace training

#include "inline/training/OutcomeLearner.inl"
