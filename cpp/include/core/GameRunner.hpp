#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/GameRecord.hpp"
#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/DrawTracker.hpp"
#include "dc3/Heuristics.hpp"

#include <chrono>

namespace core {

/*
 * Plays one game between two players and returns its GameRecord.
 *
 * The runner owns the rules: every move goes through Board::apply(), so an illegal move forfeits
 * the game for the player that made it. The game also ends on three in a row, when the side to
 * move has no move (a loss for that side), on threefold repetition (a draw) and at the ply cap (a
 * draw). Reaching the ply cap draws even if the side to move has no move. A RelayError thrown by a
 * player, from any callback during the game, ends the game with a kAborted result.
 */
class GameRunner {
 public:
  struct Params {
    auto make_options_description();

    int ply_cap = dc3::kDefaultPlyCap;
    bool print_game_states = false;
  };

  using player_array_t = AbstractPlayer::player_array_t;

  GameRunner(const Params& params, const dc3::Evaluator& evaluator)
      : params_(params), evaluator_(evaluator) {}

  GameRecord play(const dc3::Board& initial, const player_array_t& players,
                  std::chrono::milliseconds budget) const;

  const Params& params() const { return params_; }

 private:
  // Sets the result if board ends the game. Returns true if it does.
  bool check_end(const dc3::Board& board, dc3::DrawTracker& tracker, GameRecord& record) const;
  static void set_winner(GameRecord& record, dc3::seat_index_t seat, EndReason reason);

  const Params params_;
  const dc3::Evaluator& evaluator_;
};

}  // namespace core

#include "inline/core/GameRunner.inl"
