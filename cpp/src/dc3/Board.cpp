#include "dc3/Board.hpp"

#include "dc3/Exceptions.hpp"
#include "util/Exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <bit>
#include <cctype>
#include <sstream>

namespace dc3 {

Board Board::initial(BoardSize size, Ruleset ruleset) {
  const Geometry& geometry = Geometry::get(size, ruleset);
  return Board(geometry, Rules::init_position(geometry));
}

Board Board::from_str(const Geometry& geometry, const std::string& rows,
                      seat_index_t side_to_move) {
  mask_t masks[kNumPlayers] = {0, 0};
  int cell = 0;
  for (char c : rows) {
    if (std::isspace(static_cast<unsigned char>(c))) continue;
    if (cell >= geometry.num_cells()) {
      throw util::CleanException("Too many cells for a {} board", geometry.name());
    }
    if (c == 'W') {
      masks[kWhite] |= mask_t(1) << cell;
    } else if (c == 'B') {
      masks[kBlack] |= mask_t(1) << cell;
    } else if (c != '.') {
      throw util::CleanException("Unexpected character '{}' in board text", c);
    }
    ++cell;
  }
  if (cell != geometry.num_cells()) {
    throw util::CleanException("Expected {} cells for a {} board, got {}", geometry.num_cells(),
                               geometry.name(), cell);
  }
  for (seat_index_t s = 0; s < kNumPlayers; ++s) {
    int count = std::popcount(masks[s]);
    if (count > kNumPiecesPerSide) {
      const char* side = s == kWhite ? "White" : "Black";
      throw util::CleanException("{} has {} pieces, at most {} allowed", side, count,
                                 kNumPiecesPerSide);
    }
  }
  return Board(geometry, Rules::make_position(masks[kWhite], masks[kBlack], side_to_move));
}

Board::Board(const Geometry& geometry, const Position& position)
    : geometry_(&geometry), position_(position) {}

MoveList Board::legal_moves() const {
  MoveList moves;
  Rules::get_legal_moves(position_, *geometry_, moves);
  return moves;
}

bool Board::is_legal(Move move) const { return Rules::is_legal(position_, *geometry_, move); }

Board Board::apply(Move move) const {
  if (winner() != kNoSeat) {
    throw IllegalMove("Move {} played after the game was already won",
                      move.is_null() ? std::string("-") : geometry_->move_to_str(move));
  }
  if (!is_legal(move)) {
    throw IllegalMove("Illegal move {}->{} for {} at ply {}", move.src, move.dst,
                      side_to_move() == kWhite ? "white" : "black", ply_);
  }

  Board next(*this);
  next.position_ = Rules::apply(position_, move);
  next.ply_ = ply_ + 1;
  next.history_ = std::make_shared<const HistoryNode>(HistoryNode{move, history_});
  return next;
}

std::vector<Move> Board::history() const {
  std::vector<Move> moves;
  moves.reserve(ply_);
  for (const HistoryNode* node = history_.get(); node; node = node->parent.get()) {
    moves.push_back(node->move);
  }
  std::reverse(moves.begin(), moves.end());
  return moves;
}

void Board::print(std::ostream& os) const {
  int w = geometry_->width();
  int h = geometry_->height();

  os << "  ";
  for (int x = 0; x < w; ++x) os << ' ' << (x + 1);
  os << '\n';

  for (int y = 0; y < h; ++y) {
    os << ' ' << (y + 1);
    for (int x = 0; x < w; ++x) {
      seat_index_t s = position_.get_piece_at(geometry_->cell(x, y));
      os << ' ' << (s == kWhite ? 'W' : s == kBlack ? 'B' : '.');
    }
    os << '\n';
  }

  Move last = last_move();
  os << fmt::format("ply {}, {} to move", ply_, side_to_move() == kWhite ? "white" : "black");
  if (!last.is_null()) {
    os << fmt::format(", last move {}", geometry_->move_to_str(last));
  }
  os << '\n';
}

std::string Board::to_str() const {
  std::ostringstream ss;
  print(ss);
  return ss.str();
}

std::ostream& operator<<(std::ostream& os, const Board& board) {
  board.print(os);
  return os;
}

}  // namespace dc3
