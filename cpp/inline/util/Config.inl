#include "util/Config.hpp"

#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <boost/algorithm/string.hpp>

#include <fstream>

namespace util {

inline void Config::init(const boost::filesystem::path& path) {
  delete instance_;
  instance_ = new Config(path);
}

inline const Config* Config::instance() {
  if (!instance_) {
    instance_ = new Config(kFilename);
  }
  return instance_;
}

inline bool Config::contains(const std::string& key) const { return map_.contains(key); }

inline std::string Config::get(const std::string& key) const {
  auto it = map_.find(key);
  if (it == map_.end()) {
    throw Exception("Mapping for key \"{}\" required in config file {}", key,
                    config_path_.string());
  }
  return it->second;
}

inline std::string Config::get(const std::string& key, const std::string& default_value) const {
  auto it = map_.find(key);
  if (it == map_.end()) return default_value;
  return it->second;
}

inline Config::Config(const boost::filesystem::path& path) : config_path_(path) {
  if (!boost::filesystem::is_regular_file(config_path_)) return;

  std::ifstream file(config_path_.string());
  if (!file.is_open()) {
    throw CleanException("Unable to open config file {}", config_path_.string());
  }
  std::string raw_line;
  while (std::getline(file, raw_line)) {
    std::string line = raw_line.substr(0, raw_line.find('#'));  // strip comment
    boost::algorithm::trim(line);
    if (line.empty()) continue;

    size_t eq = line.find('=');
    if (eq == std::string::npos) {
      throw CleanException("Bad line in config file {}: {}", config_path_.string(), raw_line);
    }
    std::string key = line.substr(0, eq);
    std::string value = line.substr(eq + 1);

    boost::algorithm::trim(key);
    boost::algorithm::trim(value);

    if (contains(key)) {
      throw CleanException("Duplicate key \"{}\" in config file {}", key, config_path_.string());
    }
    map_[key] = value;
  }
}

inline std::string Config::dump() const {
  std::string out;
  for (const auto& [key, value] : map_) {
    out += key;
    out += " = ";
    out += value;
    out += '\n';
  }
  return out;
}

inline void Config::save(const boost::filesystem::path& path) const {
  boost_util::atomic_write_file(dump(), path);
}

}  // namespace util
