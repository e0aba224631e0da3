#pragma once

#include "core/AbstractPlayer.hpp"
#include "core/GameRecord.hpp"
#include "dc3/Board.hpp"
#include "dc3/Move.hpp"

#include <vector>

/*
 * Scripted players shared by the core and training unit tests.
 */

namespace core {
namespace tests {

/*
 * Undoes its own previous move when it can, otherwise plays the first legal move. Two
 * ShufflePlayers walk the same four positions over and over, which draws by repetition.
 */
class ShufflePlayer : public AbstractPlayer {
 public:
  dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds) override {
    std::vector<dc3::Move> history = board.history();
    if (history.size() >= 2) {
      dc3::Move mine = history[history.size() - 2];
      dc3::Move undo(mine.dst, mine.src);
      if (board.is_legal(undo)) return undo;
    }
    return board.legal_moves()[0];
  }
};

// Plays the first legal move, or the null move once forfeit_at_ply is reached.
class FirstMovePlayer : public AbstractPlayer {
 public:
  explicit FirstMovePlayer(int forfeit_at_ply = -1) : forfeit_at_ply_(forfeit_at_ply) {}

  dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds) override {
    if (forfeit_at_ply_ >= 0 && board.ply() >= forfeit_at_ply_) return dc3::Move::null();
    return board.legal_moves()[0];
  }

 private:
  const int forfeit_at_ply_;
};

// Records every callback it receives.
class EchoPlayer : public ShufflePlayer {
 public:
  bool start_game(const dc3::Board&) override {
    starts++;
    return accept;
  }

  void receive_move(const dc3::Board& board, dc3::Move move) override {
    received.push_back(move);
    last_ply = board.ply();
  }

  void end_game(const dc3::Board&, const GameRecord& record) override {
    ends++;
    last_result = record.result;
  }

  bool accept = true;
  int starts = 0;
  int ends = 0;
  int last_ply = 0;
  std::vector<dc3::Move> received;
  GameResult last_result = kAborted;
};

}  // namespace tests
}  // namespace core
