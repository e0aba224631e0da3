#pragma once

#include "dc3/Board.hpp"
#include "dc3/Constants.hpp"
#include "dc3/Heuristics.hpp"
#include "dc3/Move.hpp"
#include "dc3/Position.hpp"
#include "search/TranspositionTable.hpp"

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

namespace search {

struct SearchResult {
  std::string to_str(const dc3::Geometry& geometry) const;

  dc3::Move move;
  dc3::score_t score = 0;  // from the point of view of the side to move
  int depth = 0;           // last completed iteration
  uint64_t nodes = 0;
  uint64_t tt_hits = 0;
  bool proven = false;
  int64_t elapsed_ms = 0;
};

/*
 * Iterative-deepening negamax alpha-beta search over a shared TranspositionTable.
 *
 * Each iteration searches the root to a fixed depth with a full window. The result of an iteration
 * replaces the previous one only if the iteration completed; an iteration that observes the
 * deadline, or a cancel() call, unwinds immediately and is discarded. The first iteration is
 * never interrupted, so a legal move is always available.
 *
 * Table entries hold raw search scores. An entry's bias, written by the OutcomeLearner, is added
 * to the value of that node whenever the node is resolved, unless the value is a proven win or
 * loss. Proven scores are stored relative to the node (distance to mate from the node), and
 * converted back to root-relative scores on lookup.
 *
 * The search sees positions only, not game history, so repetition draws and the ply cap are
 * invisible to it.
 *
 * An Engine is used by one thread at a time. cancel() may be called from any thread.
 */
class Engine {
 public:
  struct Params {
    auto make_options_description();

    int max_depth = 64;
    int check_interval = 1024;  // nodes between deadline checks
  };

  using steady_clock_t = std::chrono::steady_clock;
  using time_point_t = steady_clock_t::time_point;

  Engine(const Params& params, TranspositionTable& table, const dc3::Evaluator& evaluator);

  /*
   * Returns the move for side on board. Throws util::Exception if side is not the side to move,
   * and NoLegalMove if it has no move.
   */
  dc3::Move choose_move(const dc3::Board& board, dc3::seat_index_t side,
                        std::chrono::milliseconds budget);

  // Throws NoLegalMove if the side to move has no move or the game is already won.
  SearchResult search(const dc3::Board& board, std::chrono::milliseconds budget);

  // Aborts the current search, which then returns its last completed iteration.
  void cancel() { cancelled_ = true; }

  const Params& params() const { return params_; }
  const dc3::Evaluator& evaluator() const { return evaluator_; }
  TranspositionTable& table() const { return table_; }

  // Converts proven scores between root-relative and node-relative form.
  static dc3::score_t to_tt(dc3::score_t score, int ply);
  static dc3::score_t from_tt(dc3::score_t score, int ply);

 private:
  struct RootResult {
    dc3::score_t score;
    dc3::Move move;
  };

  RootResult search_root(const dc3::Position& position, const dc3::MoveList& moves, int depth);
  dc3::score_t negamax(const dc3::Position& position, int depth, int ply, dc3::score_t alpha,
                       dc3::score_t beta);

  // Moves the table move, if legal, to the front.
  static void order_moves(dc3::MoveList& moves, dc3::Move table_move);
  static dc3::score_t clamp_heuristic(dc3::score_t score);

  bool should_stop() const;
  void check_deadline();

  const Params params_;
  TranspositionTable& table_;
  const dc3::Evaluator& evaluator_;
  const dc3::Geometry* geometry_ = nullptr;

  std::atomic<bool> cancelled_ = false;
  time_point_t deadline_;
  bool interruptible_ = false;
  bool aborted_ = false;
  uint64_t nodes_ = 0;
  uint64_t tt_hits_ = 0;
};

}  // namespace search

#include "inline/search/Engine.inl"
