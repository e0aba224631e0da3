#pragma once

#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/Move.hpp"

#include <cstdint>
#include <string>
#include <vector>

namespace core {

enum GameResult : int8_t { kWhiteWin, kBlackWin, kDraw, kAborted };

enum EndReason : int8_t {
  kThreeInARow,
  kNoLegalMove,
  kRepetition,
  kPlyCap,
  kIllegalMove,  // the offender forfeits
  kPlayerError,  // e.g. the relay connection was lost
  kNotFinished
};

/*
 * The moves of one game, each annotated with the static evaluation (white's point of view) of the
 * position right after it, plus the final result.
 */
struct GameRecord {
  struct Ply {
    dc3::Move move;
    dc3::score_t eval_after = 0;
  };

  explicit GameRecord(const dc3::Board& initial_board) : initial(initial_board) {}

  bool finished() const { return result != kAborted; }
  bool decisive() const { return result == kWhiteWin || result == kBlackWin; }
  dc3::seat_index_t winner() const;

  // +1 if seat won, -1 if it lost, 0 for a draw. Throws util::Exception for an aborted game.
  int outcome_for(dc3::seat_index_t seat) const;

  // The seat that made plies[i].
  dc3::seat_index_t mover(int i) const;

  // The board after the first n plies.
  dc3::Board board_after(int n) const;

  std::string to_str() const;

  static const char* result_to_str(GameResult result);
  static const char* reason_to_str(EndReason reason);

  dc3::Board initial;
  std::vector<Ply> plies;
  GameResult result = kAborted;
  EndReason reason = kNotFinished;
  std::string error;  // set when reason is kPlayerError
};

}  // namespace core
