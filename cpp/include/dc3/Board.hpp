#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Move.hpp"
#include "dc3/Position.hpp"

#include <memory>
#include <ostream>
#include <string>
#include <vector>

namespace dc3 {

/*
 * Immutable game state for one ply: a Position on a Geometry, the ply count and the moves that led
 * here.
 *
 * apply() returns a new Board and never modifies this one. The history is a shared linked list of
 * moves, so extending it costs one allocation regardless of game length, and a Board kept by the
 * caller stays valid after later plies are played from it.
 */
class Board {
 public:
  struct HistoryNode {
    Move move;
    std::shared_ptr<const HistoryNode> parent;
  };
  using history_ptr_t = std::shared_ptr<const HistoryNode>;

  static Board initial(BoardSize size, Ruleset ruleset = kKing);

  /*
   * Builds a board from text rows, top row first, using 'W' / 'B' for pieces and '.' for empty
   * cells. Whitespace is ignored. Throws util::CleanException if the text does not fit the
   * geometry.
   */
  static Board from_str(const Geometry& geometry, const std::string& rows,
                        seat_index_t side_to_move);

  Board(const Geometry& geometry, const Position& position);

  const Geometry& geometry() const { return *geometry_; }
  const Position& position() const { return position_; }
  seat_index_t side_to_move() const { return position_.side_to_move; }
  fingerprint_t fingerprint() const { return position_.fingerprint; }
  mask_t pieces(seat_index_t seat) const { return position_.pieces[seat]; }
  int ply() const { return ply_; }

  MoveList legal_moves() const;
  bool is_legal(Move move) const;

  // Throws IllegalMove if the move is not legal or the game is already won.
  Board apply(Move move) const;

  seat_index_t winner() const { return Rules::get_winner(position_, *geometry_); }

  // Moves from the initial board, oldest first. Its length always equals ply().
  std::vector<Move> history() const;
  Move last_move() const { return history_ ? history_->move : Move::null(); }

  void print(std::ostream& os) const;
  std::string to_str() const;

 private:
  const Geometry* geometry_;
  Position position_;
  int ply_ = 0;
  history_ptr_t history_;
};

std::ostream& operator<<(std::ostream& os, const Board& board);

}  // namespace dc3
