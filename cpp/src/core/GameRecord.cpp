#include "core/GameRecord.hpp"

#include "util/Exception.hpp"

#include <fmt/format.h>

namespace core {

dc3::seat_index_t GameRecord::winner() const {
  switch (result) {
    case kWhiteWin:
      return dc3::kWhite;
    case kBlackWin:
      return dc3::kBlack;
    default:
      return dc3::kNoSeat;
  }
}

int GameRecord::outcome_for(dc3::seat_index_t seat) const {
  if (result == kAborted) {
    throw util::Exception("No outcome for an aborted game ({})", reason_to_str(reason));
  }
  if (result == kDraw) return 0;
  return winner() == seat ? 1 : -1;
}

dc3::seat_index_t GameRecord::mover(int i) const {
  return i % 2 == 0 ? initial.side_to_move() : dc3::opponent_of(initial.side_to_move());
}

dc3::Board GameRecord::board_after(int n) const {
  dc3::Board board = initial;
  for (int i = 0; i < n; ++i) {
    board = board.apply(plies[i].move);
  }
  return board;
}

std::string GameRecord::to_str() const {
  std::string s = fmt::format("{} after {} plies ({})", result_to_str(result), plies.size(),
                              reason_to_str(reason));
  if (!error.empty()) s += fmt::format(": {}", error);
  return s;
}

const char* GameRecord::result_to_str(GameResult result) {
  switch (result) {
    case kWhiteWin:
      return "white wins";
    case kBlackWin:
      return "black wins";
    case kDraw:
      return "draw";
    case kAborted:
      return "aborted";
    default:
      return "?";
  }
}

const char* GameRecord::reason_to_str(EndReason reason) {
  switch (reason) {
    case kThreeInARow:
      return "three in a row";
    case kNoLegalMove:
      return "no legal move";
    case kRepetition:
      return "threefold repetition";
    case kPlyCap:
      return "ply cap";
    case kIllegalMove:
      return "illegal move";
    case kPlayerError:
      return "player error";
    case kNotFinished:
      return "not finished";
    default:
      return "?";
  }
}

}  // namespace core
