#include "generic_players/RemotePlayer.hpp"

#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

namespace generic {

RemotePlayer::RemotePlayer(const Params& params) : params_(params) {
  if (params.port <= 0) {
    throw util::CleanException("Remote play requires --port");
  }
  if (params.game_id.empty()) {
    throw util::CleanException("Remote play requires --game-id");
  }
  socket_ = io::Socket::create_client_socket(params.host, params.port);
  socket_->write_line(params.game_id);
  LOG_INFO("Joined game {} on relay {}:{}", params.game_id, params.host, params.port);
}

RemotePlayer::~RemotePlayer() { socket_->shutdown(); }

void RemotePlayer::receive_move(const dc3::Board& board, dc3::Move move) {
  // board is the position after move. Only moves by the local side, after which the remote side
  // is to move, go to the relay.
  if (board.side_to_move() != get_my_seat()) return;
  socket_->write_line(board.geometry().move_to_str(move));
}

dc3::Move RemotePlayer::get_move(const dc3::Board& board, std::chrono::milliseconds budget) {
  std::string line;
  if (!socket_->read_line(&line, int(budget.count()))) {
    throw io::RelayError("Relay closed the connection for game {}", params_.game_id);
  }
  try {
    return board.geometry().move_from_str(line);
  } catch (const util::CleanException& e) {
    throw io::RelayError("Relay sent malformed move '{}': {}", line, e.what());
  }
}

}  // namespace generic
