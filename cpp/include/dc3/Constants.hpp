#pragma once

#include <cstdint>

namespace dc3 {

using mask_t = uint64_t;
using seat_index_t = int8_t;
using cell_t = int8_t;
using fingerprint_t = uint64_t;
using score_t = int32_t;

const int kNumPlayers = 2;
const seat_index_t kWhite = 0;
const seat_index_t kBlack = 1;
const seat_index_t kNoSeat = -1;

const int kWinLength = 3;
const int kNumPiecesPerSide = 4;
const int kMaxCells = 64;
const int kMaxNeighbors = 8;
const int kMaxMoves = kNumPiecesPerSide * kMaxNeighbors;
const int kDefaultPlyCap = 200;
const int kRepetitionLimit = 3;

// A win found p plies from the root scores kWinScore - p. Anything at or beyond kMinWinScore in
// absolute value is a proven result; heuristic scores are always strictly inside it.
constexpr score_t kWinScore = 1'000'000;
constexpr score_t kMinWinScore = kWinScore - 1000;
constexpr score_t kInfinity = kWinScore + 1;

enum BoardSize : int8_t { kSmall, kLarge };
enum Ruleset : int8_t { kKing, kOrthogonal };

inline seat_index_t opponent_of(seat_index_t seat) { return 1 - seat; }

inline bool is_proven(score_t score) { return score >= kMinWinScore || score <= -kMinWinScore; }

}  // namespace dc3
