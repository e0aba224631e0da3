#include "util/Exception.hpp"
#include "util/FileUtil.hpp"

#include <cstdio>

namespace util {

inline char* read_file(const char* filename, size_t* file_size) {
  FILE* file = fopen(filename, "rb");
  if (!file) {
    throw util::Exception("Failed to open file '{}'", filename);
  }

  if (fseek(file, 0, SEEK_END) != 0) {
    fclose(file);
    throw util::Exception("Failed to seek to end of file '{}'", filename);
  }

  long size = ftell(file);
  if (size < 0) {
    fclose(file);
    throw util::Exception("Failed to detect size of file '{}'", filename);
  }

  if (fseek(file, 0, SEEK_SET) != 0) {
    fclose(file);
    throw util::Exception("Failed to seek to start of file '{}'", filename);
  }

  char* buffer = new char[size > 0 ? size : 1];
  size_t read_size = fread(buffer, 1, size, file);
  if (read_size != size_t(size)) {
    delete[] buffer;
    fclose(file);
    throw util::Exception("Failed to read all bytes ({} != {}) of file '{}'", read_size, size,
                          filename);
  }

  fclose(file);
  *file_size = size;
  return buffer;
}

}  // namespace util
