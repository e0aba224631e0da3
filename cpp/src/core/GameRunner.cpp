#include "core/GameRunner.hpp"

#include "dc3/Exceptions.hpp"
#include "util/LoggingUtil.hpp"
#include "util/SocketUtil.hpp"

#include <fmt/format.h>

#include <iostream>

namespace core {

GameRecord GameRunner::play(const dc3::Board& initial, const player_array_t& players,
                            std::chrono::milliseconds budget) const {
  GameRecord record(initial);

  for (dc3::seat_index_t seat = 0; seat < dc3::kNumPlayers; ++seat) {
    players[seat]->init_game(seat);
    if (!players[seat]->start_game(initial)) {
      record.reason = kPlayerError;
      record.error = fmt::format("player {} refused to play", players[seat]->get_name());
      LOG_WARN("Game aborted: {}", record.error);
      return record;
    }
  }

  dc3::DrawTracker tracker;
  dc3::Board board = initial;
  if (params_.print_game_states) board.print(std::cout);

  while (!check_end(board, tracker, record)) {
    dc3::seat_index_t seat = board.side_to_move();
    AbstractPlayer* player = players[seat];

    dc3::Move move;
    try {
      move = player->get_move(board, budget);
      board = board.apply(move);
      record.plies.push_back({move, evaluator_.evaluate(board.position(), board.geometry())});
      for (AbstractPlayer* p : players) {
        p->receive_move(board, move);
      }
    } catch (const dc3::IllegalMove& e) {
      LOG_WARN("{} forfeits: {}", player->get_name(), e.what());
      set_winner(record, dc3::opponent_of(seat), kIllegalMove);
      break;
    } catch (const io::RelayError& e) {
      LOG_ERROR("Game aborted at ply {}: {}", record.plies.size(), e.what());
      record.reason = kPlayerError;
      record.error = e.what();
      break;
    }

    if (params_.print_game_states) board.print(std::cout);
  }

  LOG_INFO("Game over: {}", record.to_str());
  for (AbstractPlayer* p : players) {
    p->end_game(board, record);
  }
  return record;
}

bool GameRunner::check_end(const dc3::Board& board, dc3::DrawTracker& tracker,
                           GameRecord& record) const {
  dc3::seat_index_t winner = board.winner();
  if (winner != dc3::kNoSeat) {
    set_winner(record, winner, kThreeInARow);
    return true;
  }
  if (tracker.add(board.position())) {
    record.result = kDraw;
    record.reason = kRepetition;
    return true;
  }
  if (int(record.plies.size()) >= params_.ply_cap) {
    record.result = kDraw;
    record.reason = kPlyCap;
    return true;
  }
  if (board.legal_moves().empty()) {
    set_winner(record, dc3::opponent_of(board.side_to_move()), kNoLegalMove);
    return true;
  }
  return false;
}

void GameRunner::set_winner(GameRecord& record, dc3::seat_index_t seat, EndReason reason) {
  record.result = seat == dc3::kWhite ? kWhiteWin : kBlackWin;
  record.reason = reason;
}

}  // namespace core
