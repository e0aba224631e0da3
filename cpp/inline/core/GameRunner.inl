#include "core/GameRunner.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace core {

inline auto GameRunner::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Game options");

  return desc
    .template add_option<"ply-cap">(po::value<int>(&ply_cap)->default_value(ply_cap),
                                    "number of plies after which the game is a draw")
    .template add_flag<"print-game-states", "do-not-print-game-states">(
      &print_game_states, "print board after each ply", "do not print board after each ply");
}

}  // namespace core
