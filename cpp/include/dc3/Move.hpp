#pragma once

#include "dc3/Constants.hpp"
#include "util/Asserts.hpp"

#include <array>
#include <compare>
#include <cstdint>

namespace dc3 {

/*
 * A piece relocation from src to dst, both flat cell indices (x + y * width).
 *
 * For persistence a move is encoded in 16 bits as (src << 8) | dst, with kNullEncoding reserved
 * for the null move. Human-readable text ("12E", "34NW") requires the board geometry, see
 * Geometry::move_to_str().
 */
struct Move {
  static constexpr uint16_t kNullEncoding = 0xFFFF;

  Move() = default;
  Move(cell_t s, cell_t d) : src(s), dst(d) {}

  static Move null() { return Move(); }
  bool is_null() const { return src < 0; }

  uint16_t encode() const;
  static Move decode(uint16_t encoding);

  auto operator<=>(const Move&) const = default;

  cell_t src = -1;
  cell_t dst = -1;
};

/*
 * Fixed-capacity list of moves. A side never has more than kMaxMoves legal moves, so move
 * generation in the search never touches the heap.
 */
class MoveList {
 public:
  using array_t = std::array<Move, kMaxMoves>;

  void push_back(Move move) {
    DEBUG_ASSERT(size_ < kMaxMoves, "MoveList overflow");
    moves_[size_++] = move;
  }
  int size() const { return size_; }
  bool empty() const { return size_ == 0; }
  const Move& operator[](int i) const { return moves_[i]; }
  Move& operator[](int i) { return moves_[i]; }

  array_t::const_iterator begin() const { return moves_.begin(); }
  array_t::const_iterator end() const { return moves_.begin() + size_; }
  array_t::iterator begin() { return moves_.begin(); }
  array_t::iterator end() { return moves_.begin() + size_; }

  bool contains(Move move) const;

 private:
  array_t moves_;
  int size_ = 0;
};

}  // namespace dc3

#include "inline/dc3/Move.inl"
