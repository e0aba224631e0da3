#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/DrawTracker.hpp"
#include "dc3/Exceptions.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Heuristics.hpp"
#include "dc3/Move.hpp"
#include "dc3/Position.hpp"
#include "util/Exception.hpp"
#include "util/GTestUtil.hpp"
#include "util/Random.hpp"

#include <gtest/gtest.h>

#include <bit>
#include <random>
#include <set>
#include <string>

using dc3::Board;
using dc3::Geometry;
using dc3::Move;
using dc3::MoveList;

namespace {

Move parse(const Board& board, const std::string& text) {
  return board.geometry().move_from_str(text);
}

Board play(Board board, std::initializer_list<const char*> moves) {
  for (const char* text : moves) {
    board = board.apply(parse(board, text));
  }
  return board;
}

}  // namespace

TEST(Geometry, dimensions) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  const Geometry& large = Geometry::get(dc3::kLarge);
  EXPECT_EQ(small.width(), 5);
  EXPECT_EQ(small.height(), 4);
  EXPECT_EQ(large.width(), 7);
  EXPECT_EQ(large.height(), 6);
  EXPECT_EQ(small.name(), "small/king");
  EXPECT_EQ(Geometry::get(dc3::kLarge, dc3::kOrthogonal).name(), "large/orthogonal");
  EXPECT_NE(small.id(), large.id());
  EXPECT_NE(small.id(), Geometry::get(dc3::kSmall, dc3::kOrthogonal).id());
}

TEST(Geometry, start_positions) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  Board board = Board::initial(dc3::kSmall);
  Board expected = Board::from_str(small,
                                   "W...B"
                                   "B...W"
                                   "W...B"
                                   "B...W",
                                   dc3::kWhite);
  EXPECT_EQ(board.position(), expected.position());

  Board large = Board::initial(dc3::kLarge);
  Board expected_large = Board::from_str(Geometry::get(dc3::kLarge),
                                         "......."
                                         "W.....B"
                                         "B.....W"
                                         "W.....B"
                                         "B.....W"
                                         ".......",
                                         dc3::kWhite);
  EXPECT_EQ(large.position(), expected_large.position());
}

TEST(Geometry, neighbors) {
  const Geometry& king = Geometry::get(dc3::kSmall, dc3::kKing);
  const Geometry& orthogonal = Geometry::get(dc3::kSmall, dc3::kOrthogonal);

  EXPECT_EQ(std::popcount(king.neighbors(king.cell(0, 0))), 3);
  EXPECT_EQ(std::popcount(king.neighbors(king.cell(2, 1))), 8);
  EXPECT_EQ(std::popcount(king.neighbors(king.cell(2, 0))), 5);
  EXPECT_EQ(std::popcount(orthogonal.neighbors(orthogonal.cell(0, 0))), 2);
  EXPECT_EQ(std::popcount(orthogonal.neighbors(orthogonal.cell(2, 1))), 4);

  for (int c = 0; c < king.num_cells(); ++c) {
    EXPECT_FALSE(king.neighbors(c) & (dc3::mask_t(1) << c));
  }
}

TEST(Geometry, winning_lines) {
  // 12 horizontal, 10 vertical and 6 along each diagonal.
  EXPECT_EQ(Geometry::get(dc3::kSmall).winning_masks().size(), 34u);
  EXPECT_EQ(Geometry::get(dc3::kSmall, dc3::kOrthogonal).winning_masks().size(), 34u);
  for (dc3::mask_t line : Geometry::get(dc3::kLarge).winning_masks()) {
    EXPECT_EQ(std::popcount(line), dc3::kWinLength);
  }
}

TEST(Geometry, move_text) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  EXPECT_EQ(small.move_from_str("11E"), Move(0, 1));
  EXPECT_EQ(small.move_from_str("34NW"), Move(small.cell(2, 3), small.cell(1, 2)));
  EXPECT_EQ(small.move_to_str(Move(small.cell(2, 3), small.cell(1, 2))), "34NW");
  EXPECT_EQ(small.move_to_str(Move(small.cell(4, 0), small.cell(3, 0))), "51W");

  EXPECT_THROW(small.move_from_str("11W"), util::CleanException);
  EXPECT_THROW(small.move_from_str("99E"), util::CleanException);
  EXPECT_THROW(small.move_from_str("1E"), util::CleanException);
  EXPECT_THROW(small.move_from_str("12X"), util::CleanException);
  EXPECT_THROW(Geometry::get(dc3::kSmall, dc3::kOrthogonal).move_from_str("22NE"),
               util::CleanException);
  EXPECT_THROW(Geometry::parse_board_size("medium"), util::CleanException);
  EXPECT_THROW(Geometry::parse_ruleset("bishop"), util::CleanException);
}

TEST(Move, encoding) {
  Move move(17, 11);
  EXPECT_EQ(move.encode(), (17 << 8) | 11);
  EXPECT_EQ(Move::decode(move.encode()), move);
  EXPECT_EQ(Move::null().encode(), Move::kNullEncoding);
  EXPECT_TRUE(Move::decode(Move::kNullEncoding).is_null());
}

TEST(MoveGenerator, initial_moves) {
  EXPECT_EQ(Board::initial(dc3::kSmall).legal_moves().size(), 10);
  EXPECT_EQ(Board::initial(dc3::kSmall, dc3::kOrthogonal).legal_moves().size(), 4);

  // Generator order: by source cell, then W E N S NW NE SW SE.
  MoveList moves = Board::initial(dc3::kSmall).legal_moves();
  EXPECT_EQ(moves[0], Move(0, 1));
  EXPECT_EQ(moves[1], Move(0, 6));
}

TEST(MoveGenerator, random_playouts_preserve_invariants) {
  std::mt19937 prng(12345);
  for (dc3::BoardSize size : {dc3::kSmall, dc3::kLarge}) {
    for (dc3::Ruleset ruleset : {dc3::kKing, dc3::kOrthogonal}) {
      for (int game = 0; game < 20; ++game) {
        Board board = Board::initial(size, ruleset);
        const Geometry& geometry = board.geometry();
        for (int ply = 0; ply < 100 && board.winner() == dc3::kNoSeat; ++ply) {
          MoveList moves = board.legal_moves();
          if (moves.empty()) break;

          dc3::mask_t own = board.pieces(board.side_to_move());
          dc3::mask_t occupied = board.position().occupied();
          for (Move move : moves) {
            EXPECT_TRUE(own & (dc3::mask_t(1) << move.src));
            EXPECT_FALSE(occupied & (dc3::mask_t(1) << move.dst));
            EXPECT_TRUE(geometry.neighbors(move.src) & (dc3::mask_t(1) << move.dst));
            EXPECT_TRUE(board.is_legal(move));
          }

          Board before = board;
          Move move = moves[util::Random::uniform_sample(prng, 0, moves.size())];
          board = board.apply(move);

          EXPECT_EQ(before.ply(), ply);
          EXPECT_EQ(before.side_to_move(), dc3::opponent_of(board.side_to_move()));
          EXPECT_EQ(board.ply(), ply + 1);
          EXPECT_EQ(int(board.history().size()), board.ply());
          EXPECT_EQ(board.last_move(), move);
          for (dc3::seat_index_t s = 0; s < dc3::kNumPlayers; ++s) {
            EXPECT_EQ(std::popcount(board.pieces(s)), dc3::kNumPiecesPerSide);
            EXPECT_EQ(std::popcount(before.pieces(s)), dc3::kNumPiecesPerSide);
          }
          EXPECT_EQ(board.fingerprint(), dc3::Zobrist::compute(board.position()));
        }
      }
    }
  }
}

TEST(Board, apply_does_not_mutate) {
  Board board = Board::initial(dc3::kSmall);
  dc3::Position position = board.position();
  Board next = play(board, {"11E"});
  EXPECT_EQ(board.position(), position);
  EXPECT_EQ(board.ply(), 0);
  EXPECT_TRUE(board.history().empty());
  EXPECT_EQ(next.ply(), 1);
  EXPECT_EQ(next.history(), std::vector<Move>{Move(0, 1)});
}

TEST(Board, transpositions_share_fingerprint) {
  Board initial = Board::initial(dc3::kSmall);
  Board a = play(initial, {"11E", "51W", "54W", "14E"});
  Board b = play(initial, {"54W", "14E", "11E", "51W"});
  EXPECT_EQ(a.position(), b.position());
  EXPECT_EQ(a.fingerprint(), b.fingerprint());
  EXPECT_NE(a.history(), b.history());
}

TEST(Board, side_to_move_changes_fingerprint) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  const char* rows =
    "W...B"
    "B...W"
    "W...B"
    "B...W";
  Board white = Board::from_str(small, rows, dc3::kWhite);
  Board black = Board::from_str(small, rows, dc3::kBlack);
  EXPECT_NE(white.fingerprint(), black.fingerprint());
  EXPECT_FALSE(white.position() == black.position());
}

TEST(Board, from_str_errors) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  EXPECT_THROW(Board::from_str(small, "W...B", dc3::kWhite), util::CleanException);
  EXPECT_THROW(Board::from_str(small, "X...B B...W W...B B...W", dc3::kWhite),
               util::CleanException);
  EXPECT_THROW(Board::from_str(small, "W...B B...W W...B B...W .", dc3::kWhite),
               util::CleanException);
  EXPECT_THROW(Board::from_str(small, "WWW.B WW... ..... B....", dc3::kBlack),
               util::CleanException);

  const Geometry& large = Geometry::get(dc3::kLarge);
  std::string crowded =
      "WWWWWWW"
      "WWW...."
      "......."
      "......."
      "......."
      "B.....B";
  EXPECT_THROW(Board::from_str(large, crowded, dc3::kWhite), util::CleanException);
}

TEST(Board, illegal_moves) {
  Board board = Board::initial(dc3::kSmall);
  const Geometry& small = board.geometry();
  EXPECT_THROW(board.apply(Move(small.cell(0, 1), small.cell(1, 1))), dc3::IllegalMove);  // black
  EXPECT_THROW(board.apply(Move(small.cell(0, 0), small.cell(0, 1))), dc3::IllegalMove);  // full
  EXPECT_THROW(board.apply(Move(small.cell(0, 0), small.cell(2, 0))), dc3::IllegalMove);  // far
  EXPECT_THROW(board.apply(Move::null()), dc3::IllegalMove);

  Board orthogonal = Board::initial(dc3::kSmall, dc3::kOrthogonal);
  EXPECT_THROW(orthogonal.apply(Move(small.cell(0, 0), small.cell(1, 1))), dc3::IllegalMove);
}

TEST(Board, winner) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  Board board = Board::from_str(small,
                                "WW..B"
                                "..W.."
                                "....B"
                                "W.BB.",
                                dc3::kWhite);
  EXPECT_EQ(board.winner(), dc3::kNoSeat);

  Board won = board.apply(small.move_from_str("32N"));
  EXPECT_EQ(won.winner(), dc3::kWhite);
  EXPECT_THROW(won.apply(small.move_from_str("51S")), dc3::IllegalMove);

  Board diagonal = Board::from_str(small,
                                   "B...W"
                                   ".B..."
                                   "..B.W"
                                   "W...W",
                                   dc3::kWhite);
  EXPECT_EQ(diagonal.winner(), dc3::kBlack);
}

TEST(DrawTracker, threefold_repetition) {
  Board initial = Board::initial(dc3::kSmall);
  dc3::DrawTracker tracker;
  EXPECT_FALSE(tracker.add(initial.position()));

  Board board = initial;
  for (int cycle = 0; cycle < 2; ++cycle) {
    board = play(board, {"11E", "51W", "21W", "41E"});
    EXPECT_EQ(board.position(), initial.position());
    bool draw = tracker.add(board.position());
    EXPECT_EQ(draw, cycle == 1);
  }
  EXPECT_EQ(tracker.count(initial.position()), 3);
  tracker.clear();
  EXPECT_EQ(tracker.count(initial.position()), 0);
}

TEST(Evaluator, symmetric_start) {
  dc3::Evaluator evaluator;
  Board board = Board::initial(dc3::kSmall);
  const Geometry& small = board.geometry();

  // The start position is mirror-symmetric, so only the tempo term remains.
  dc3::FeatureVector features = dc3::Evaluator::compute_features(board.position(), small);
  for (int f = 0; f < dc3::kTempo; ++f) {
    EXPECT_DOUBLE_EQ(features[f], 0.0) << dc3::Evaluator::feature_name(dc3::Feature(f));
  }
  EXPECT_EQ(features[dc3::kTempo], 1.0);
  EXPECT_EQ(evaluator.evaluate(board.position(), small), 50);
  EXPECT_EQ(evaluator.evaluate_for_side_to_move(board.position(), small), 50);

  Board after = play(board, {"11E"});
  dc3::score_t score = evaluator.evaluate(after.position(), small);
  EXPECT_EQ(evaluator.evaluate_for_side_to_move(after.position(), small), -score);
}

TEST(Evaluator, terminal_scores_saturate) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  dc3::Evaluator evaluator({1000, 1000, 1000, 1000, 1000, 1000});

  Board won = Board::from_str(small,
                              "WWW.B"
                              "....."
                              "....B"
                              "W.BB.",
                              dc3::kBlack);
  EXPECT_EQ(evaluator.evaluate(won.position(), small), dc3::kWinScore);
  EXPECT_EQ(evaluator.evaluate_for_side_to_move(won.position(), small), -dc3::kWinScore);

  Board trapped = Board::from_str(small,
                                  "WB..."
                                  "BB..."
                                  "....."
                                  ".....",
                                  dc3::kWhite);
  EXPECT_EQ(evaluator.evaluate(trapped.position(), small), -dc3::kWinScore);

  // Heuristic scores stay strictly inside the proven range.
  Board board = Board::initial(dc3::kLarge);
  dc3::score_t score = evaluator.evaluate(board.position(), board.geometry());
  EXPECT_FALSE(dc3::is_proven(score));
}

TEST(Evaluator, features) {
  const Geometry& small = Geometry::get(dc3::kSmall);
  // White has a run of two on row 0 and a third piece next to the empty end. Black's pieces are
  // scattered.
  Board board = Board::from_str(small,
                                "WW..B"
                                "..W.."
                                "B...B"
                                "W.B..",
                                dc3::kBlack);
  dc3::FeatureVector f = dc3::Evaluator::compute_features(board.position(), small);
  EXPECT_GT(f[dc3::kRunsOfTwo], 0);
  EXPECT_GT(f[dc3::kThreats], 0);
  EXPECT_EQ(f[dc3::kTempo], -1.0);
}

TEST(Evaluator, weights_text) {
  dc3::WeightVector weights = dc3::Evaluator::parse_weights("1,5,0.1,10,25,0.5");
  EXPECT_EQ(weights, dc3::Evaluator::kDefaultWeights);
  EXPECT_EQ(dc3::Evaluator::weights_to_str(weights), "1,5,0.1,10,25,0.5");
  EXPECT_THROW(dc3::Evaluator::parse_weights("1,2,3"), util::CleanException);
  EXPECT_THROW(dc3::Evaluator::parse_weights("1,2,3,4,5,x"), util::CleanException);

  dc3::Evaluator::Params params;
  EXPECT_EQ(params.get_weights(), dc3::Evaluator::kDefaultWeights);
  params.weights = "0,0,0,0,0,1";
  EXPECT_EQ(params.get_weights()[dc3::kTempo], 1.0);
}

int main(int argc, char** argv) { return launch_gtest(argc, argv); }
