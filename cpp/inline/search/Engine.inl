#include "search/Engine.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

#include <algorithm>

namespace search {

inline auto Engine::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"max-depth">(po::value<int>(&max_depth)->default_value(max_depth),
                                      "maximum iterative-deepening depth")
    .template add_hidden_option<"check-interval">(
      po::value<int>(&check_interval)->default_value(check_interval),
      "nodes searched between deadline checks");
}

inline dc3::score_t Engine::to_tt(dc3::score_t score, int ply) {
  if (score >= dc3::kMinWinScore) return score + ply;
  if (score <= -dc3::kMinWinScore) return score - ply;
  return score;
}

inline dc3::score_t Engine::from_tt(dc3::score_t score, int ply) {
  if (score >= dc3::kMinWinScore) return score - ply;
  if (score <= -dc3::kMinWinScore) return score + ply;
  return score;
}

inline dc3::score_t Engine::clamp_heuristic(dc3::score_t score) {
  return std::clamp(score, -dc3::kMinWinScore + 1, dc3::kMinWinScore - 1);
}

inline bool Engine::should_stop() const {
  return cancelled_ || steady_clock_t::now() >= deadline_;
}

inline void Engine::check_deadline() {
  if (interruptible_ && nodes_ % params_.check_interval == 0 && should_stop()) {
    aborted_ = true;
  }
}

}  // namespace search
