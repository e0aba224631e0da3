#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Move.hpp"

#include <array>
#include <string>
#include <vector>

namespace dc3 {

/*
 * Static description of a board: its dimensions, its adjacency rule, its winning lines and its
 * start position. There is exactly one Geometry per (BoardSize, Ruleset) pair, obtained with
 * Geometry::get(); Boards and Positions refer to it by pointer.
 *
 * Cell (x, y) has flat index x + y * width, with x the column from the left and y the row from the
 * top.
 *
 *    small (5x4)        large (7x6)
 *
 *    W . . . B          . . . . . . .
 *    B . . . W          W . . . . . B
 *    W . . . B          B . . . . . W
 *    B . . . W          W . . . . . B
 *                       B . . . . . W
 *                       . . . . . . .
 */
class Geometry {
 public:
  // Directions in move-generation order. N is towards row 0.
  enum Direction : int8_t { kW, kE, kN, kS, kNW, kNE, kSW, kSE, kNumDirections };

  static const Geometry& get(BoardSize size, Ruleset ruleset = kKing);

  BoardSize size() const { return size_; }
  Ruleset ruleset() const { return ruleset_; }
  int width() const { return width_; }
  int height() const { return height_; }
  int num_cells() const { return width_ * height_; }

  // Stable identifier written into persisted files, so a table built for one geometry is never
  // loaded into another.
  uint32_t id() const { return (uint32_t(size_) << 4) | uint32_t(ruleset_); }
  std::string name() const;

  int cell(int x, int y) const { return x + y * width_; }
  int x_of(int cell) const { return cell % width_; }
  int y_of(int cell) const { return cell / width_; }
  bool on_board(int x, int y) const { return x >= 0 && x < width_ && y >= 0 && y < height_; }

  // Cells reachable from cell in one move under the ruleset.
  mask_t neighbors(int cell) const { return neighbors_[cell]; }

  // Cell reached from cell in direction d, or -1 if that leaves the board or d is not allowed by
  // the ruleset.
  int step(int cell, Direction d) const;

  const std::vector<mask_t>& winning_masks() const { return winning_masks_; }
  const std::vector<mask_t>& two_run_masks() const { return two_run_masks_; }

  // Chebyshev distance from the cell to the centre of the board.
  double center_distance(int cell) const { return center_distance_[cell]; }

  mask_t start_mask(seat_index_t seat) const { return start_masks_[seat]; }

  /*
   * Move text is "xyD": 1-based column and row digits followed by a direction among N E S W NE NW
   * SE SW, e.g. "12E" or "34NW".
   *
   * move_from_str() throws util::CleanException if the text is malformed, names a cell off the
   * board, or uses a direction the ruleset does not allow. It does not check that the move is
   * legal in any particular position.
   */
  std::string move_to_str(Move move) const;
  Move move_from_str(const std::string& str) const;

  static BoardSize parse_board_size(const std::string& str);
  static Ruleset parse_ruleset(const std::string& str);
  static const char* board_size_to_str(BoardSize size);
  static const char* ruleset_to_str(Ruleset ruleset);

 private:
  Geometry(BoardSize size, Ruleset ruleset);
  Geometry(const Geometry&) = delete;
  Geometry& operator=(const Geometry&) = delete;

  void add_lines(int length, std::vector<mask_t>& masks) const;

  static constexpr int kDx[kNumDirections] = {-1, 1, 0, 0, -1, 1, -1, 1};
  static constexpr int kDy[kNumDirections] = {0, 0, -1, 1, -1, -1, 1, 1};
  static constexpr const char* kDirectionNames[kNumDirections] = {"W",  "E",  "N",  "S",
                                                                  "NW", "NE", "SW", "SE"};

  const BoardSize size_;
  const Ruleset ruleset_;
  int width_;
  int height_;
  std::array<mask_t, kMaxCells> neighbors_ = {};
  std::array<double, kMaxCells> center_distance_ = {};
  std::array<mask_t, kNumPlayers> start_masks_ = {};
  std::vector<mask_t> winning_masks_;
  std::vector<mask_t> two_run_masks_;
};

}  // namespace dc3
