#pragma once

#include "core/AbstractPlayer.hpp"
#include "dc3/Board.hpp"
#include "util/SocketUtil.hpp"

#include <string>

namespace generic {

/*
 * Stands in for an opponent reached through a relay server.
 *
 * The relay protocol is line based. On construction the player connects and sends the game id,
 * which the relay uses to pair it with the opponent. After that each move is one line of move
 * text: receive_move() forwards the moves made by the local side, and get_move() blocks for the
 * opponent's next line, for at most the think budget.
 *
 * Connection loss, a timeout or unparseable move text raise io::RelayError.
 */
class RemotePlayer : public core::AbstractPlayer {
 public:
  struct Params {
    auto make_options_description();

    std::string host = "localhost";
    io::port_t port = 0;
    std::string game_id;
  };

  explicit RemotePlayer(const Params& params);
  ~RemotePlayer() override;

  RemotePlayer(const RemotePlayer&) = delete;
  RemotePlayer& operator=(const RemotePlayer&) = delete;

  void receive_move(const dc3::Board& board, dc3::Move move) override;
  dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds budget) override;

 private:
  const Params params_;
  io::Socket* socket_;
};

}  // namespace generic

#include "inline/generic_players/RemotePlayer.inl"
