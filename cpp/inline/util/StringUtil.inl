#include "util/StringUtil.hpp"

#include "util/Exception.hpp"

#include <cctype>
#include <string_view>

namespace util {

inline double atof_safe(const std::string& s) {
  size_t read = 0;
  double f = 0;
  try {
    f = std::stod(s, &read);
  } catch (const std::logic_error&) {
    throw CleanException("atof failure {}(\"{}\")", __func__, s);
  }
  if (read != s.size() || s.empty()) {
    throw CleanException("atof failure {}(\"{}\")", __func__, s);
  }
  return f;
}

inline int atoi_safe(const std::string& s) {
  size_t read = 0;
  int i = 0;
  try {
    i = std::stoi(s, &read);
  } catch (const std::logic_error&) {
    throw CleanException("atoi failure {}(\"{}\")", __func__, s);
  }
  if (read != s.size() || s.empty()) {
    throw CleanException("atoi failure {}(\"{}\")", __func__, s);
  }
  return i;
}

inline std::vector<std::string> split(const std::string& s, const char* t) {
  std::vector<std::string> result;
  std::string_view sep(t);

  if (sep.empty()) {
    std::string_view sv(s);
    std::size_t pos = 0, n = sv.size();
    while (pos < n) {
      while (pos < n && std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      if (pos >= n) break;
      std::size_t start = pos;
      while (pos < n && !std::isspace(static_cast<unsigned char>(sv[pos]))) ++pos;
      result.emplace_back(sv.substr(start, pos - start));
    }
  } else {
    std::size_t start = 0, end;
    while ((end = s.find(sep, start)) != std::string::npos) {
      result.emplace_back(s.data() + start, end - start);
      start = end + sep.size();
    }
    result.emplace_back(s.data() + start, s.size() - start);
  }

  return result;
}

}  // namespace util
