#include "dc3/Position.hpp"

#include <bit>
#include <random>

namespace dc3 {

inline seat_index_t Position::get_piece_at(int cell) const {
  mask_t m = mask_t(1) << cell;
  if (pieces[kWhite] & m) return kWhite;
  if (pieces[kBlack] & m) return kBlack;
  return kNoSeat;
}

inline Zobrist::Keys::Keys() {
  std::mt19937_64 prng(kSeed);
  for (int s = 0; s < kNumPlayers; ++s) {
    for (int c = 0; c < kMaxCells; ++c) {
      piece[s][c] = prng();
    }
  }
  side = prng();
}

inline const Zobrist::Keys& Zobrist::keys() {
  static const Keys keys;
  return keys;
}

inline fingerprint_t Zobrist::compute(const Position& position) {
  fingerprint_t fp = 0;
  for (int s = 0; s < kNumPlayers; ++s) {
    mask_t m = position.pieces[s];
    while (m) {
      int c = std::countr_zero(m);
      m &= m - 1;
      fp ^= piece_key(s, c);
    }
  }
  if (position.side_to_move == kBlack) fp ^= side_key();
  return fp;
}

inline Position Rules::init_position(const Geometry& geometry) {
  return make_position(geometry.start_mask(kWhite), geometry.start_mask(kBlack), kWhite);
}

inline Position Rules::make_position(mask_t white, mask_t black, seat_index_t side_to_move) {
  Position position;
  position.pieces[kWhite] = white;
  position.pieces[kBlack] = black;
  position.side_to_move = side_to_move;
  position.fingerprint = Zobrist::compute(position);
  return position;
}

inline void Rules::get_legal_moves(const Position& position, const Geometry& geometry,
                                   MoveList& moves) {
  mask_t empty = ~position.occupied();
  mask_t own = position.pieces[position.side_to_move];
  while (own) {
    int src = std::countr_zero(own);
    own &= own - 1;
    for (int d = 0; d < Geometry::kNumDirections; ++d) {
      int dst = geometry.step(src, Geometry::Direction(d));
      if (dst >= 0 && (empty & (mask_t(1) << dst))) {
        moves.push_back(Move(src, dst));
      }
    }
  }
}

inline int Rules::count_moves(const Position& position, const Geometry& geometry,
                              seat_index_t seat) {
  mask_t empty = ~position.occupied();
  mask_t own = position.pieces[seat];
  int count = 0;
  while (own) {
    int src = std::countr_zero(own);
    own &= own - 1;
    count += std::popcount(geometry.neighbors(src) & empty);
  }
  return count;
}

inline bool Rules::is_legal(const Position& position, const Geometry& geometry, Move move) {
  if (move.is_null() || move.src >= geometry.num_cells() || move.dst < 0 ||
      move.dst >= geometry.num_cells()) {
    return false;
  }
  mask_t src_mask = mask_t(1) << move.src;
  mask_t dst_mask = mask_t(1) << move.dst;
  return (position.pieces[position.side_to_move] & src_mask) &&
         !(position.occupied() & dst_mask) && (geometry.neighbors(move.src) & dst_mask);
}

inline Position Rules::apply(const Position& position, Move move) {
  Position next = position;
  seat_index_t s = position.side_to_move;
  next.pieces[s] ^= (mask_t(1) << move.src) | (mask_t(1) << move.dst);
  next.side_to_move = opponent_of(s);
  next.fingerprint ^= Zobrist::piece_key(s, move.src) ^ Zobrist::piece_key(s, move.dst) ^
                      Zobrist::side_key();
  return next;
}

inline bool Rules::has_line(const Position& position, const Geometry& geometry,
                            seat_index_t seat) {
  mask_t own = position.pieces[seat];
  for (mask_t line : geometry.winning_masks()) {
    if ((line & own) == line) return true;
  }
  return false;
}

inline seat_index_t Rules::get_winner(const Position& position, const Geometry& geometry) {
  seat_index_t last_mover = opponent_of(position.side_to_move);
  if (has_line(position, geometry, last_mover)) return last_mover;
  if (has_line(position, geometry, position.side_to_move)) return position.side_to_move;
  return kNoSeat;
}

}  // namespace dc3
