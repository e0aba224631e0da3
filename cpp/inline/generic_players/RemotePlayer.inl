#include "generic_players/RemotePlayer.hpp"

#include "util/BoostUtil.hpp"

#include <boost/program_options.hpp>

namespace generic {

inline auto RemotePlayer::Params::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Remote play options");

  return desc
    .template add_option<"host">(po::value<std::string>(&host)->default_value(host),
                                 "relay host")
    .template add_option<"port">(po::value<io::port_t>(&port)->default_value(port), "relay port")
    .template add_option<"game-id">(po::value<std::string>(&game_id)->default_value(game_id),
                                    "identifier the relay uses to pair the two players");
}

}  // namespace generic
