#include "search/Engine.hpp"

#include "search/Exceptions.hpp"
#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace search {

using dc3::kInfinity;
using dc3::kNoSeat;
using dc3::kWinScore;
using dc3::Move;
using dc3::MoveList;
using dc3::Position;
using dc3::Rules;
using dc3::score_t;

std::string SearchResult::to_str(const dc3::Geometry& geometry) const {
  return fmt::format("move={} score={}{} depth={} nodes={} tt_hits={} elapsed={}ms",
                     move.is_null() ? "none" : geometry.move_to_str(move), score,
                     proven ? " (proven)" : "", depth, nodes, tt_hits, elapsed_ms);
}

Engine::Engine(const Params& params, TranspositionTable& table, const dc3::Evaluator& evaluator)
    : params_(params), table_(table), evaluator_(evaluator) {
  RELEASE_ASSERT(params.max_depth >= 1, "max_depth must be positive ({})", params.max_depth);
  RELEASE_ASSERT(params.check_interval >= 1, "check_interval must be positive ({})",
                 params.check_interval);
}

Move Engine::choose_move(const dc3::Board& board, dc3::seat_index_t side,
                         std::chrono::milliseconds budget) {
  if (side != board.side_to_move()) {
    throw util::Exception("Asked to move for seat {} but seat {} is to move", side,
                          board.side_to_move());
  }
  SearchResult result = search(board, budget);
  LOG_INFO("Engine chose {}", result.to_str(board.geometry()));
  return result.move;
}

SearchResult Engine::search(const dc3::Board& board, std::chrono::milliseconds budget) {
  time_point_t start = steady_clock_t::now();
  deadline_ = start + budget;
  cancelled_ = false;
  aborted_ = false;
  interruptible_ = false;
  nodes_ = 0;
  tt_hits_ = 0;
  geometry_ = &board.geometry();

  if (board.winner() != kNoSeat) {
    throw NoLegalMove("The game is already won by seat {}", board.winner());
  }
  MoveList moves = board.legal_moves();
  if (moves.empty()) {
    throw NoLegalMove("Seat {} has no legal move at ply {}", board.side_to_move(), board.ply());
  }

  SearchResult result;
  result.move = moves[0];

  for (int depth = 1; depth <= params_.max_depth; ++depth) {
    if (depth > 1 && should_stop()) break;
    interruptible_ = depth > 1;

    RootResult root = search_root(board.position(), moves, depth);
    if (aborted_) {
      LOG_DEBUG("Depth {} aborted after {} nodes", depth, nodes_);
      break;
    }

    result.move = root.move;
    result.score = root.score;
    result.depth = depth;
    result.proven = dc3::is_proven(root.score);
    result.nodes = nodes_;
    result.tt_hits = tt_hits_;
    result.elapsed_ms = util::to_ms(steady_clock_t::now() - start);
    LOG_DEBUG("Depth {}: {}", depth, result.to_str(board.geometry()));

    if (result.proven) break;
  }

  result.nodes = nodes_;
  result.tt_hits = tt_hits_;
  result.elapsed_ms = util::to_ms(steady_clock_t::now() - start);
  return result;
}

Engine::RootResult Engine::search_root(const Position& position, const MoveList& root_moves,
                                       int depth) {
  nodes_++;
  MoveList moves = root_moves;
  auto entry = table_.lookup(position.fingerprint);
  if (entry) order_moves(moves, entry->best_move);

  score_t alpha = -kInfinity;
  score_t beta = kInfinity;
  RootResult best{-kInfinity, moves[0]};
  for (Move move : moves) {
    Position child = Rules::apply(position, move);
    score_t score = -negamax(child, depth - 1, 1, -beta, -alpha);
    if (aborted_) return best;
    if (score > best.score) {
      best.score = score;
      best.move = move;
    }
    alpha = std::max(alpha, best.score);
  }

  table_.store(position.fingerprint, to_tt(best.score, 0), depth, best.move, kExact);
  return best;
}

score_t Engine::negamax(const Position& position, int depth, int ply, score_t alpha,
                        score_t beta) {
  nodes_++;
  check_deadline();
  if (aborted_) return 0;

  dc3::seat_index_t winner = Rules::get_winner(position, *geometry_);
  if (winner != kNoSeat) {
    return winner == position.side_to_move ? kWinScore - ply : -(kWinScore - ply);
  }

  MoveList moves;
  Rules::get_legal_moves(position, *geometry_, moves);
  if (moves.empty()) return -(kWinScore - ply);

  auto entry = table_.lookup(position.fingerprint);
  score_t bias = entry ? entry->bias : 0;

  if (entry && !entry->bias_only() && entry->depth >= depth) {
    score_t score = from_tt(entry->score, ply);
    if (!dc3::is_proven(score)) score = clamp_heuristic(score + bias);
    if (entry->bound == kExact || (entry->bound == kLowerBound && score >= beta) ||
        (entry->bound == kUpperBound && score <= alpha)) {
      tt_hits_++;
      return score;
    }
  }

  if (depth == 0) {
    return clamp_heuristic(evaluator_.evaluate_for_side_to_move(position, *geometry_) + bias);
  }

  if (entry) order_moves(moves, entry->best_move);

  // Children are searched on the raw scale, so the window is shifted by the bias.
  score_t raw_alpha = alpha - bias;
  score_t raw_beta = beta - bias;
  score_t original_alpha = raw_alpha;

  score_t best = -kInfinity;
  Move best_move;
  for (Move move : moves) {
    Position child = Rules::apply(position, move);
    score_t score = -negamax(child, depth - 1, ply + 1, -raw_beta, -raw_alpha);
    if (aborted_) return 0;
    if (score > best) {
      best = score;
      best_move = move;
    }
    raw_alpha = std::max(raw_alpha, best);
    if (raw_alpha >= raw_beta) break;
  }

  BoundKind bound = kExact;
  if (best <= original_alpha) {
    bound = kUpperBound;
  } else if (best >= raw_beta) {
    bound = kLowerBound;
  }
  table_.store(position.fingerprint, to_tt(best, ply), depth, best_move, bound);

  if (dc3::is_proven(best)) return best;
  return clamp_heuristic(best + bias);
}

void Engine::order_moves(MoveList& moves, Move table_move) {
  if (table_move.is_null()) return;
  for (int i = 0; i < moves.size(); ++i) {
    if (moves[i] == table_move) {
      std::rotate(moves.begin(), moves.begin() + i, moves.begin() + i + 1);
      return;
    }
  }
}

}  // namespace search
