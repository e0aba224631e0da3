#include "training/OutcomeLearner.hpp"

#include "dc3/Board.hpp"
#include "util/Asserts.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

#include <cmath>

namespace training {

std::string OutcomeLearner::Correction::to_str() const {
  return fmt::format("ply={} fingerprint={:016x} delta={}", ply, fingerprint, delta);
}

OutcomeLearner::OutcomeLearner(const Params& params, search::TranspositionTable& table)
    : params_(params), table_(table) {
  RELEASE_ASSERT(params.neighbor_plies >= 0, "neighbor_plies must be non-negative");
}

dc3::score_t OutcomeLearner::mover_view(const core::GameRecord& record, int ply) {
  dc3::score_t eval = record.plies[ply].eval_after;
  return record.mover(ply) == dc3::kWhite ? eval : -eval;
}

int OutcomeLearner::find_disagreement(const core::GameRecord& record) const {
  for (int i = int(record.plies.size()) - 1; i >= 0; --i) {
    int outcome = record.outcome_for(record.mover(i));
    if (disagrees(mover_view(record, i), outcome)) return i;
  }
  return -1;
}

OutcomeLearner::correction_vec_t OutcomeLearner::learn(const core::GameRecord& record) {
  correction_vec_t corrections;
  if (!record.finished()) {
    LOG_WARN("Not learning from an unfinished game ({})", record.to_str());
    return corrections;
  }

  int i = find_disagreement(record);
  if (i < 0) {
    LOG_DEBUG("No disagreement in game: {}", record.to_str());
    return corrections;
  }

  // Fingerprints of the positions after each ply.
  std::vector<dc3::fingerprint_t> fingerprints;
  dc3::Board board = record.initial;
  for (int k = 0; k <= i; ++k) {
    board = board.apply(record.plies[k].move);
    fingerprints.push_back(board.fingerprint());
  }

  int outcome = record.outcome_for(record.mover(i));
  dc3::score_t v = mover_view(record, i);
  dc3::score_t target = outcome < 0 ? -params_.target_loss : 0;
  dc3::score_t delta_mover = std::lround(params_.learning_rate * (target - v));
  // A small learning rate still moves the view by at least one unit.
  if (delta_mover == 0 && target != v) delta_mover = target < v ? -1 : 1;

  // Table scores are from the side to move after the ply, which is the mover's opponent.
  corrections.push_back({i, fingerprints[i], -delta_mover});
  double scale = 1.0;
  for (int k = 1; k <= params_.neighbor_plies; ++k) {
    int j = i - 2 * k;
    if (j < 0) break;
    scale *= params_.neighbor_decay;
    dc3::score_t delta = std::lround(scale * delta_mover);
    if (delta == 0) break;
    corrections.push_back({j, fingerprints[j], -delta});
  }

  for (const Correction& correction : corrections) {
    table_.bias(correction.fingerprint, correction.delta);
    LOG_DEBUG("Correction {}", correction.to_str());
  }
  table_.flush();

  LOG_INFO("Learned from {}: ply {} (mover eval {}) corrected by {}", record.to_str(), i, v,
           -delta_mover);
  return corrections;
}

}  // namespace training
