#pragma once

#include "core/GameRecord.hpp"
#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/Move.hpp"

#include <array>
#include <chrono>
#include <string>

namespace core {

/*
 * Base class for all players.
 *
 * There are 4 main virtual functions to override:
 *
 * - start_game()
 * - receive_move()
 * - get_move()
 * - end_game()
 *
 * start_game() and end_game() are called when a game starts or ends. A single player might play
 * multiple games in succession, so you should override these methods if there is state that you
 * want to clear between games.
 *
 * receive_move() is called after every ply with the board that resulted from it. Note that you
 * get this callback even after you make your own move, as a sort of "echo" of your own move.
 *
 * get_move() is called when it is your turn to move. budget is the think time you are allowed.
 */
class AbstractPlayer {
 public:
  using player_array_t = std::array<AbstractPlayer*, dc3::kNumPlayers>;

  virtual ~AbstractPlayer() = default;
  void set_name(const std::string& name) { name_ = name; }
  const std::string& get_name() const { return name_; }
  dc3::seat_index_t get_my_seat() const { return my_seat_; }

  void init_game(dc3::seat_index_t seat_assignment) { my_seat_ = seat_assignment; }

  // start_game() should return false if the player refuses to play the game.
  virtual bool start_game(const dc3::Board&) { return true; }

  virtual void receive_move(const dc3::Board&, dc3::Move) {}

  virtual dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds budget) = 0;

  virtual void end_game(const dc3::Board&, const GameRecord&) {}

 private:
  std::string name_;
  dc3::seat_index_t my_seat_ = dc3::kNoSeat;
};

}  // namespace core
