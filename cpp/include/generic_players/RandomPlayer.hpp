#pragma once

#include "core/AbstractPlayer.hpp"
#include "dc3/Board.hpp"
#include "util/Random.hpp"

#include <random>

namespace generic {

/*
 * RandomPlayer always chooses uniformly at random among the set of legal moves.
 */
class RandomPlayer : public core::AbstractPlayer {
 public:
  explicit RandomPlayer(int seed) : prng_(seed) {}

  dc3::Move get_move(const dc3::Board& board, std::chrono::milliseconds) override {
    dc3::MoveList moves = board.legal_moves();
    return moves[util::Random::uniform_sample(prng_, 0, moves.size())];
  }

 private:
  std::mt19937 prng_;
};

}  // namespace generic
