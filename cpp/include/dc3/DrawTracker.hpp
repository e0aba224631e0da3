#pragma once

#include "dc3/Constants.hpp"
#include "dc3/Position.hpp"

#include <unordered_map>

namespace dc3 {

/*
 * Counts how often each (grid, side to move) position has occurred in a game. A position reached
 * for the kRepetitionLimit-th time draws the game.
 */
class DrawTracker {
 public:
  // Records an occurrence of position. Returns true if this occurrence draws the game.
  bool add(const Position& position) {
    return ++counts_[position.fingerprint] >= kRepetitionLimit;
  }

  int count(const Position& position) const {
    auto it = counts_.find(position.fingerprint);
    return it == counts_.end() ? 0 : it->second;
  }

  void clear() { counts_.clear(); }

 private:
  std::unordered_map<fingerprint_t, int> counts_;
};

}  // namespace dc3
