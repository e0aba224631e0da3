#pragma once

#include <cstddef>

namespace util {

// Read the contents of a file into a buffer. The buffer is allocated with new[] and must be deleted
// by the caller. The size of the file is written to *file_size.
//
// If there is an error reading the file, throws a util::Exception.
char* read_file(const char* filename, size_t* file_size);

}  // namespace util

#include "inline/util/FileUtil.inl"
