#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Move.hpp"

#include <array>

namespace dc3 {

/*
 * The hashable part of a board: one occupancy mask per side plus the side to move. The
 * fingerprint is a Zobrist hash of exactly these fields and is maintained incrementally by
 * Rules::apply(), so two positions reached by different move orders share a fingerprint.
 */
struct Position {
  bool operator==(const Position& other) const {
    return pieces == other.pieces && side_to_move == other.side_to_move;
  }

  mask_t occupied() const { return pieces[kWhite] | pieces[kBlack]; }
  seat_index_t get_piece_at(int cell) const;

  std::array<mask_t, kNumPlayers> pieces = {};
  seat_index_t side_to_move = kWhite;
  fingerprint_t fingerprint = 0;
};

/*
 * 64-bit Zobrist keys, one per (seat, cell) plus one for black-to-move. The keys come from a
 * fixed-seed std::mt19937_64, so fingerprints are identical in every process and can be
 * persisted.
 */
struct Zobrist {
  static constexpr uint64_t kSeed = 0xdc3dc3dc3ULL;

  static fingerprint_t piece_key(seat_index_t seat, int cell) { return keys().piece[seat][cell]; }
  static fingerprint_t side_key() { return keys().side; }
  static fingerprint_t compute(const Position& position);

 private:
  struct Keys {
    Keys();
    fingerprint_t piece[kNumPlayers][kMaxCells];
    fingerprint_t side;
  };
  static const Keys& keys();
};

/*
 * Move generation and terminal detection. These operate on Position rather than Board so the
 * search can recurse without carrying any history.
 */
struct Rules {
  static Position init_position(const Geometry& geometry);
  static Position make_position(mask_t white, mask_t black, seat_index_t side_to_move);

  // Legal moves for the side to move, in cell order and then Geometry::Direction order.
  static void get_legal_moves(const Position& position, const Geometry& geometry, MoveList& moves);

  // Number of moves seat would have if it were to move.
  static int count_moves(const Position& position, const Geometry& geometry, seat_index_t seat);

  static bool is_legal(const Position& position, const Geometry& geometry, Move move);

  // Applies a move without checking it. Flips the side to move and updates the fingerprint.
  static Position apply(const Position& position, Move move);

  static bool has_line(const Position& position, const Geometry& geometry, seat_index_t seat);

  /*
   * Returns the seat with three in a row, or kNoSeat. Only the side that just moved can complete
   * a line, so it is checked first; the side to move can only hold a line in a hand-built
   * position.
   */
  static seat_index_t get_winner(const Position& position, const Geometry& geometry);
};

}  // namespace dc3

#include "inline/dc3/Position.inl"
