#include "dc3/Move.hpp"

#include <algorithm>

namespace dc3 {

inline uint16_t Move::encode() const {
  if (is_null()) return kNullEncoding;
  return (uint16_t(uint8_t(src)) << 8) | uint8_t(dst);
}

inline Move Move::decode(uint16_t encoding) {
  if (encoding == kNullEncoding) return Move();
  return Move(cell_t(encoding >> 8), cell_t(encoding & 0xFF));
}

inline bool MoveList::contains(Move move) const {
  return std::find(begin(), end(), move) != end();
}

}  // namespace dc3
