#include "core/AbstractPlayer.hpp"
#include "core/GameRecord.hpp"
#include "core/GameRunner.hpp"
#include "core/tests/Common.hpp"
#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Heuristics.hpp"
#include "generic_players/EnginePlayer.hpp"
#include "generic_players/RandomPlayer.hpp"
#include "generic_players/RemotePlayer.hpp"
#include "search/TranspositionTable.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/SocketUtil.hpp"

#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>
#include <vector>

using core::GameRecord;
using core::GameRunner;
using core::tests::EchoPlayer;
using core::tests::FirstMovePlayer;
using core::tests::ShufflePlayer;
using dc3::Board;
using dc3::Move;
using std::chrono::milliseconds;

namespace {

const dc3::Geometry& small() { return dc3::Geometry::get(dc3::kSmall); }

// Loses its connection while being told about the opponent's first move.
class DroppedRelayPlayer : public ShufflePlayer {
 public:
  void receive_move(const Board& board, Move) override {
    if (board.side_to_move() == get_my_seat()) throw io::RelayError("send failed");
  }
};

GameRecord play(core::AbstractPlayer& white, core::AbstractPlayer& black,
                GameRunner::Params params = GameRunner::Params(),
                Board initial = Board::initial(dc3::kSmall),
                milliseconds budget = milliseconds(50)) {
  static const dc3::Evaluator evaluator;
  GameRunner runner(params, evaluator);
  return runner.play(initial, {&white, &black}, budget);
}

}  // namespace

TEST(GameRecord, outcome_for) {
  GameRecord record(Board::initial(dc3::kSmall));
  EXPECT_FALSE(record.finished());
  EXPECT_THROW(record.outcome_for(dc3::kWhite), util::Exception);

  record.result = core::kBlackWin;
  EXPECT_TRUE(record.decisive());
  EXPECT_EQ(record.winner(), dc3::kBlack);
  EXPECT_EQ(record.outcome_for(dc3::kWhite), -1);
  EXPECT_EQ(record.outcome_for(dc3::kBlack), 1);

  record.result = core::kDraw;
  EXPECT_FALSE(record.decisive());
  EXPECT_EQ(record.winner(), dc3::kNoSeat);
  EXPECT_EQ(record.outcome_for(dc3::kBlack), 0);

  EXPECT_EQ(record.mover(0), dc3::kWhite);
  EXPECT_EQ(record.mover(1), dc3::kBlack);
}

TEST(GameRunner, random_games_terminate) {
  for (int seed = 0; seed < 20; ++seed) {
    generic::RandomPlayer white(seed);
    generic::RandomPlayer black(1000 + seed);
    GameRecord record = play(white, black);

    ASSERT_TRUE(record.finished()) << record.to_str();
    EXPECT_LE(int(record.plies.size()), dc3::kDefaultPlyCap);

    Board final_board = record.board_after(record.plies.size());
    switch (record.reason) {
      case core::kThreeInARow:
        EXPECT_EQ(final_board.winner(), record.winner());
        EXPECT_EQ(record.mover(record.plies.size() - 1), record.winner());
        break;
      case core::kNoLegalMove:
        EXPECT_TRUE(final_board.legal_moves().empty());
        EXPECT_EQ(record.winner(), dc3::opponent_of(final_board.side_to_move()));
        break;
      case core::kRepetition:
      case core::kPlyCap:
        EXPECT_EQ(record.result, core::kDraw);
        break;
      default:
        FAIL() << "unexpected end: " << record.to_str();
    }
  }
}

TEST(GameRunner, repetition_draw) {
  ShufflePlayer white;
  ShufflePlayer black;
  GameRecord record = play(white, black);

  EXPECT_EQ(record.result, core::kDraw);
  EXPECT_EQ(record.reason, core::kRepetition);
  ASSERT_EQ(record.plies.size(), 8u);

  std::vector<std::string> expected = {"11E", "51W", "21W", "41E", "11E", "51W", "21W", "41E"};
  for (size_t i = 0; i < expected.size(); ++i) {
    EXPECT_EQ(small().move_to_str(record.plies[i].move), expected[i]) << "ply " << i;
  }
  EXPECT_EQ(record.board_after(8).fingerprint(), record.initial.fingerprint());
}

TEST(GameRunner, ply_cap) {
  ShufflePlayer white;
  ShufflePlayer black;
  GameRunner::Params params;
  params.ply_cap = 3;
  GameRecord record = play(white, black, params);

  EXPECT_EQ(record.result, core::kDraw);
  EXPECT_EQ(record.reason, core::kPlyCap);
  EXPECT_EQ(record.plies.size(), 3u);
}

TEST(GameRunner, illegal_move_forfeits) {
  ShufflePlayer white;
  FirstMovePlayer black(0);
  GameRecord record = play(white, black);

  EXPECT_EQ(record.result, core::kWhiteWin);
  EXPECT_EQ(record.reason, core::kIllegalMove);
  EXPECT_EQ(record.plies.size(), 1u);
}

TEST(GameRunner, winning_move_ends_game) {
  Board initial = Board::from_str(small(),
                                  "WW..B"
                                  "..W.."
                                  "....B"
                                  "W.BB.",
                                  dc3::kWhite);
  search::TranspositionTable::Params table_params;
  search::TranspositionTable table(table_params, small());
  generic::EnginePlayer white(search::Engine::Params(), table, dc3::Evaluator::kDefaultWeights);
  ShufflePlayer black;
  GameRecord record = play(white, black, GameRunner::Params(), initial);

  EXPECT_EQ(record.result, core::kWhiteWin);
  EXPECT_EQ(record.reason, core::kThreeInARow);
  ASSERT_EQ(record.plies.size(), 1u);
  EXPECT_EQ(small().move_to_str(record.plies[0].move), "32N");
}

TEST(GameRunner, trapped_side_loses) {
  Board initial = Board::from_str(small(),
                                  "WB..."
                                  "BB..."
                                  "....."
                                  ".....",
                                  dc3::kWhite);
  ShufflePlayer white;
  ShufflePlayer black;
  GameRecord record = play(white, black, GameRunner::Params(), initial);

  EXPECT_EQ(record.result, core::kBlackWin);
  EXPECT_EQ(record.reason, core::kNoLegalMove);
  EXPECT_TRUE(record.plies.empty());
}

TEST(GameRunner, ply_cap_precedes_trapped_side) {
  Board initial = Board::from_str(small(),
                                  "WB..."
                                  "BB..."
                                  "....."
                                  ".....",
                                  dc3::kWhite);
  ShufflePlayer white;
  ShufflePlayer black;
  GameRunner::Params params;
  params.ply_cap = 0;
  GameRecord record = play(white, black, params, initial);

  EXPECT_EQ(record.result, core::kDraw);
  EXPECT_EQ(record.reason, core::kPlyCap);
  EXPECT_TRUE(record.plies.empty());
}

TEST(GameRunner, relay_error_on_receive_aborts) {
  ShufflePlayer white;
  DroppedRelayPlayer black;
  GameRecord record = play(white, black);

  EXPECT_FALSE(record.finished());
  EXPECT_EQ(record.reason, core::kPlayerError);
  EXPECT_EQ(record.error, "send failed");
  EXPECT_EQ(record.plies.size(), 1u);
}

TEST(GameRunner, annotates_evaluations) {
  ShufflePlayer white;
  ShufflePlayer black;
  GameRunner::Params params;
  params.ply_cap = 6;
  GameRecord record = play(white, black, params);

  const dc3::Evaluator evaluator;
  ASSERT_EQ(record.plies.size(), 6u);
  for (int i = 0; i < 6; ++i) {
    Board board = record.board_after(i + 1);
    EXPECT_EQ(record.plies[i].eval_after, evaluator.evaluate(board.position(), board.geometry()));
  }
}

TEST(GameRunner, player_callbacks) {
  EchoPlayer white;
  EchoPlayer black;
  GameRunner::Params params;
  params.ply_cap = 5;
  GameRecord record = play(white, black, params);

  ASSERT_EQ(record.plies.size(), 5u);
  EXPECT_EQ(white.get_my_seat(), dc3::kWhite);
  EXPECT_EQ(black.get_my_seat(), dc3::kBlack);
  for (EchoPlayer* p : {&white, &black}) {
    EXPECT_EQ(p->starts, 1);
    EXPECT_EQ(p->ends, 1);
    EXPECT_EQ(p->last_ply, 5);
    EXPECT_EQ(p->last_result, core::kDraw);
    ASSERT_EQ(p->received.size(), 5u);
    for (int i = 0; i < 5; ++i) EXPECT_EQ(p->received[i], record.plies[i].move);
  }
}

TEST(GameRunner, refusal_aborts) {
  EchoPlayer white;
  EchoPlayer black;
  black.accept = false;
  GameRecord record = play(white, black);

  EXPECT_FALSE(record.finished());
  EXPECT_EQ(record.reason, core::kPlayerError);
  EXPECT_TRUE(record.plies.empty());
}

TEST(RemotePlayer, requires_port_and_game_id) {
  generic::RemotePlayer::Params params;
  params.game_id = "g1";
  EXPECT_THROW(generic::RemotePlayer{params}, util::CleanException);

  params.port = 9;
  params.game_id = "";
  EXPECT_THROW(generic::RemotePlayer{params}, util::CleanException);
}

TEST(RemotePlayer, relay_game) {
  io::Socket* server = io::Socket::create_server_socket(0, 1);

  std::vector<std::string> relay_received;
  std::thread relay([&] {
    io::Socket* connection = server->accept();
    std::string line;
    for (int i = 0; i < 2; ++i) {
      if (!connection->read_line(&line, 5000)) break;
      relay_received.push_back(line);
    }
    connection->write_line("51W");
    if (connection->read_line(&line, 5000)) relay_received.push_back(line);
    connection->shutdown();
  });

  GameRecord record(Board::initial(dc3::kSmall));
  {
    generic::RemotePlayer::Params params;
    params.port = server->get_port();
    params.game_id = "g1";
    generic::RemotePlayer remote(params);
    ShufflePlayer local;
    record = play(local, remote, GameRunner::Params(), Board::initial(dc3::kSmall),
                  milliseconds(5000));
  }
  relay.join();
  server->shutdown();

  std::vector<std::string> expected = {"g1", "11E", "21W"};
  EXPECT_EQ(relay_received, expected);

  EXPECT_FALSE(record.finished());
  EXPECT_EQ(record.reason, core::kPlayerError);
  ASSERT_EQ(record.plies.size(), 3u);
  EXPECT_EQ(record.plies[1].move, Move(4, 3));
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
