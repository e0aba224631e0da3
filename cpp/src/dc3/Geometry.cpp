#include "dc3/Geometry.hpp"

#include "util/Exception.hpp"

#include <fmt/format.h>

#include <algorithm>
#include <cctype>
#include <cmath>

namespace dc3 {

namespace {

mask_t cell_mask(int cell) { return mask_t(1) << cell; }

}  // namespace

const Geometry& Geometry::get(BoardSize size, Ruleset ruleset) {
  static const Geometry small_king(kSmall, kKing);
  static const Geometry small_orthogonal(kSmall, kOrthogonal);
  static const Geometry large_king(kLarge, kKing);
  static const Geometry large_orthogonal(kLarge, kOrthogonal);

  if (size == kSmall) {
    return ruleset == kKing ? small_king : small_orthogonal;
  }
  return ruleset == kKing ? large_king : large_orthogonal;
}

Geometry::Geometry(BoardSize size, Ruleset ruleset) : size_(size), ruleset_(ruleset) {
  width_ = (size == kSmall) ? 5 : 7;
  height_ = (size == kSmall) ? 4 : 6;

  double cx = (width_ - 1) / 2.0;
  double cy = (height_ - 1) / 2.0;
  for (int c = 0; c < num_cells(); ++c) {
    for (int d = 0; d < kNumDirections; ++d) {
      int n = step(c, Direction(d));
      if (n >= 0) neighbors_[c] |= cell_mask(n);
    }
    center_distance_[c] = std::max(std::abs(x_of(c) - cx), std::abs(y_of(c) - cy));
  }

  // Each side sits in alternating cells of the two outer columns, mirrored across the board.
  int r = width_ - 1;
  int y0 = (size == kSmall) ? 0 : 1;
  for (int i = 0; i < kNumPiecesPerSide; ++i) {
    int y = y0 + i;
    seat_index_t left = (i % 2 == 0) ? kWhite : kBlack;
    start_masks_[left] |= cell_mask(cell(0, y));
    start_masks_[opponent_of(left)] |= cell_mask(cell(r, y));
  }

  add_lines(kWinLength, winning_masks_);
  add_lines(2, two_run_masks_);
}

void Geometry::add_lines(int length, std::vector<mask_t>& masks) const {
  // Lines run east, south, south-east and south-west from their first cell, independent of the
  // ruleset: adjacency governs movement, not alignment.
  constexpr int kLineDx[] = {1, 0, 1, -1};
  constexpr int kLineDy[] = {0, 1, 1, 1};
  for (int c = 0; c < num_cells(); ++c) {
    for (int k = 0; k < 4; ++k) {
      int x = x_of(c);
      int y = y_of(c);
      int ex = x + kLineDx[k] * (length - 1);
      int ey = y + kLineDy[k] * (length - 1);
      if (!on_board(ex, ey)) continue;

      mask_t mask = 0;
      for (int i = 0; i < length; ++i) {
        mask |= cell_mask(cell(x + kLineDx[k] * i, y + kLineDy[k] * i));
      }
      masks.push_back(mask);
    }
  }
}

int Geometry::step(int cell, Direction d) const {
  if (ruleset_ == kOrthogonal && d >= kNW) return -1;
  int x = x_of(cell) + kDx[d];
  int y = y_of(cell) + kDy[d];
  if (!on_board(x, y)) return -1;
  return this->cell(x, y);
}

std::string Geometry::name() const {
  return fmt::format("{}/{}", board_size_to_str(size_), ruleset_to_str(ruleset_));
}

std::string Geometry::move_to_str(Move move) const {
  if (move.is_null()) return "-";
  int dx = x_of(move.dst) - x_of(move.src);
  int dy = y_of(move.dst) - y_of(move.src);
  for (int d = 0; d < kNumDirections; ++d) {
    if (kDx[d] == dx && kDy[d] == dy) {
      return fmt::format("{}{}{}", x_of(move.src) + 1, y_of(move.src) + 1, kDirectionNames[d]);
    }
  }
  throw util::Exception("Move {}->{} is not between adjacent cells", move.src, move.dst);
}

Move Geometry::move_from_str(const std::string& str) const {
  if (str.size() < 3 || str.size() > 4 || !std::isdigit(str[0]) || !std::isdigit(str[1])) {
    throw util::CleanException("Invalid move text \"{}\"", str);
  }
  int x = str[0] - '1';
  int y = str[1] - '1';
  if (!on_board(x, y)) {
    throw util::CleanException("Move text \"{}\" names a cell off the {} board", str, name());
  }

  std::string dir = str.substr(2);
  for (int d = 0; d < kNumDirections; ++d) {
    if (dir != kDirectionNames[d]) continue;
    int dst = step(cell(x, y), Direction(d));
    if (dst < 0) {
      throw util::CleanException("Move text \"{}\" leaves the board or is not allowed on {}", str,
                                 name());
    }
    return Move(cell(x, y), dst);
  }
  throw util::CleanException("Invalid direction in move text \"{}\"", str);
}

BoardSize Geometry::parse_board_size(const std::string& str) {
  if (str == "small") return kSmall;
  if (str == "large") return kLarge;
  throw util::CleanException("Unknown board size \"{}\" (expected small or large)", str);
}

Ruleset Geometry::parse_ruleset(const std::string& str) {
  if (str == "king") return kKing;
  if (str == "orthogonal") return kOrthogonal;
  throw util::CleanException("Unknown ruleset \"{}\" (expected king or orthogonal)", str);
}

const char* Geometry::board_size_to_str(BoardSize size) {
  return size == kSmall ? "small" : "large";
}

const char* Geometry::ruleset_to_str(Ruleset ruleset) {
  return ruleset == kKing ? "king" : "orthogonal";
}

}  // namespace dc3
