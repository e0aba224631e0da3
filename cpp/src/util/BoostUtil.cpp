#include "util/BoostUtil.hpp"

#include "util/Exception.hpp"

#include <fstream>

namespace boost_util {

std::string get_option_value(const std::vector<std::string>& args, const std::string& option_name) {
  std::string dashed_option_name = "--" + option_name;
  for (size_t i = 0; i < args.size(); ++i) {
    const std::string& arg = args[i];
    if (arg == dashed_option_name) {
      if (i + 1 < args.size()) {
        return args[i + 1];
      }
    } else {
      size_t eq_pos = arg.find('=');
      if (eq_pos != std::string::npos) {
        std::string name = arg.substr(0, eq_pos);
        if (name == dashed_option_name) {
          return arg.substr(eq_pos + 1);
        }
      }
    }
  }
  return "";
}

void atomic_write_file(const std::string& str, const boost::filesystem::path& filename) {
  namespace bf = boost::filesystem;

  bf::path tmp_filename = filename;
  tmp_filename += ".tmp";

  {
    std::ofstream file(tmp_filename.string(), std::ios::binary | std::ios::trunc);
    if (!file.is_open()) {
      throw util::Exception("Unable to open file: {}", tmp_filename.string());
    }
    file.write(str.data(), str.size());
    file.close();
    if (!file.good()) {
      throw util::Exception("Failed to write to {}", tmp_filename.string());
    }
  }

  boost::system::error_code ec;
  bf::rename(tmp_filename, filename, ec);
  if (ec) {
    throw util::Exception("Failed to rename {} to {}: {}", tmp_filename.string(), filename.string(),
                          ec.message());
  }
}

}  // namespace boost_util
