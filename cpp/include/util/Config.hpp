#pragma once

#include <map>
#include <string>

#include <boost/filesystem.hpp>

namespace util {

/*
 * Key-value pairs read from a plain text file of "key = value" lines. Anything after a '#' is a
 * comment. A missing file is treated as an empty config.
 *
 * Config::instance() is the process-wide config, loaded from the path passed to Config::init()
 * (the --config cmdline option, defaulting to kFilename in the working directory). Standalone
 * Config objects read and write other key-value files, such as the trainer checkpoint.
 */
class Config {
 public:
  static constexpr const char* kFilename = "dc3.cfg";

  Config() = default;
  explicit Config(const boost::filesystem::path& path);

  static void init(const boost::filesystem::path& path);
  static const Config* instance();

  bool contains(const std::string& key) const;
  std::string get(const std::string& key) const;  // throws exception if key not found
  std::string get(const std::string& key, const std::string& default_value) const;
  void set(const std::string& key, const std::string& value) { map_[key] = value; }

  // Writes the config back out atomically, in sorted key order.
  void save(const boost::filesystem::path& path) const;
  std::string dump() const;

  boost::filesystem::path config_path() const { return config_path_; }

 private:
  using map_t = std::map<std::string, std::string>;
  static inline Config* instance_ = nullptr;
  boost::filesystem::path config_path_;
  map_t map_;
};

}  // namespace util

#include "inline/util/Config.inl"
