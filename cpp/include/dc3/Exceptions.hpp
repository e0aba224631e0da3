#pragma once

#include "util/Exception.hpp"

namespace dc3 {

// Raised by Board::apply() for a move that the rules do not allow in the current position.
class IllegalMove : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace dc3
