#pragma once

#include "core/AbstractPlayer.hpp"
#include "dc3/Board.hpp"
#include "dc3/Heuristics.hpp"
#include "search/Engine.hpp"
#include "search/TranspositionTable.hpp"

namespace generic {

/*
 * EnginePlayer moves with a search::Engine. It owns the engine and its evaluator; the table is
 * shared with whoever else plays from it.
 */
class EnginePlayer : public core::AbstractPlayer {
 public:
  EnginePlayer(const search::Engine::Params& params, search::TranspositionTable& table,
               const dc3::WeightVector& weights)
      : evaluator_(weights), engine_(params, table, evaluator_) {}

  dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds budget) override {
    return engine_.choose_move(board, get_my_seat(), budget);
  }

  search::Engine& engine() { return engine_; }

 private:
  const dc3::Evaluator evaluator_;
  search::Engine engine_;
};

}  // namespace generic
