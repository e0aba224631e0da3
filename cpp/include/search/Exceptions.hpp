#pragma once

#include "util/Exception.hpp"

namespace search {

// The side to move has no legal move. Callers treat this as a loss for that side.
class NoLegalMove : public util::Exception {
 public:
  using util::Exception::Exception;
};

// The persistent table file cannot be read or written. The table degrades to in-memory.
class StorageUnavailable : public util::Exception {
 public:
  using util::Exception::Exception;
};

// A persisted record fails validation. The record is discarded.
class CorruptEntry : public util::Exception {
 public:
  using util::Exception::Exception;
};

}  // namespace search
