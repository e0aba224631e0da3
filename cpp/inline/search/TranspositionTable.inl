#include "search/TranspositionTable.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace search {

inline auto TranspositionTable::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Transposition table options");

  return desc
    .template add_option<"tt-filename">(
      po::value<std::string>(&filename)->default_value(filename),
      "journal file for the transposition table (empty: in-memory only)")
    .template add_option<"tt-flush-threshold">(
      po::value<int>(&flush_threshold)->default_value(flush_threshold),
      "number of modified entries that triggers an automatic flush")
    .template add_option<"tt-compaction-ratio">(
      po2::default_value("{:.1f}", &compaction_ratio),
      "compact the journal once it holds this many records per live entry")
    .template add_hidden_option<"tt-num-shards">(
      po::value<int>(&num_shards)->default_value(num_shards), "number of lock shards");
}

}  // namespace search
