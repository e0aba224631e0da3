#include "core/AbstractPlayer.hpp"
#include "core/GameRecord.hpp"
#include "core/GameRunner.hpp"
#include "dc3/Board.hpp"
#include "dc3/Geometry.hpp"
#include "dc3/Heuristics.hpp"
#include "generic_players/EnginePlayer.hpp"
#include "generic_players/RemotePlayer.hpp"
#include "search/Engine.hpp"
#include "search/TranspositionTable.hpp"
#include "training/HeuristicTuner.hpp"
#include "training/OutcomeLearner.hpp"
#include "training/SelfPlayTrainer.hpp"
#include "util/BoostUtil.hpp"
#include "util/Config.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <chrono>
#include <climits>
#include <csignal>
#include <iostream>
#include <string>
#include <unistd.h>

namespace {

struct Args {
  auto make_options_description();

  std::string mode = "watch";
  std::string board = "small";
  std::string ruleset = "king";
  std::string config_filename = util::Config::kFilename;
  bool play_black = false;
};

auto Args::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Program options");

  return desc
    .template add_option<"mode">(po::value<std::string>(&mode)->default_value(mode),
                                 "watch, train, tune or remote")
    .template add_option<"board", 'b'>(po::value<std::string>(&board)->default_value(board),
                                       "board size: small (5x4) or large (7x6)")
    .template add_option<"ruleset">(po::value<std::string>(&ruleset)->default_value(ruleset),
                                    "king (8 directions) or orthogonal (4 directions)")
    .template add_option<"config">(
      po::value<std::string>(&config_filename)->default_value(config_filename),
      "key=value file with default paths (tt_filename, checkpoint_filename)")
    .template add_flag<"black", "white">(&play_black, "in remote mode, the local engine is black",
                                         "in remote mode, the local engine is white");
}

training::SelfPlayTrainer* active_trainer = nullptr;

void signal_handler(int) {
  if (active_trainer) active_trainer->stop();
}

}  // namespace

int main(int ac, char* av[]) {
  try {
    namespace po = boost::program_options;
    namespace po2 = boost_util::program_options;

    Args args;
    util::Logging::Params log_params;
    util::Random::Params random_params;
    dc3::Evaluator::Params evaluator_params;
    search::TranspositionTable::Params table_params;
    search::Engine::Params engine_params;
    core::GameRunner::Params runner_params;
    training::OutcomeLearner::Params learner_params;
    training::SelfPlayTrainer::Params trainer_params;
    training::HeuristicTuner::Params tuner_params;
    generic::RemotePlayer::Params remote_params;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(args.make_options_description())
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(evaluator_params.make_options_description())
                  .add(table_params.make_options_description())
                  .add(engine_params.make_options_description())
                  .add(runner_params.make_options_description())
                  .add(learner_params.make_options_description())
                  .add(trainer_params.make_options_description())
                  .add(tuner_params.make_options_description())
                  .add(remote_params.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    bool help_full = vm.count("help-full");
    bool help = vm.count("help");
    if (help || help_full) {
      po2::Settings::help_full = help_full;
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);
    util::Config::init(args.config_filename);

    LOG_INFO("Starting process {}", getpid());

    const util::Config* config = util::Config::instance();
    if (table_params.filename.empty()) {
      table_params.filename = config->get("tt_filename", "");
    }
    if (trainer_params.checkpoint_filename.empty()) {
      trainer_params.checkpoint_filename = config->get("checkpoint_filename", "");
    }

    const dc3::Geometry& geometry = dc3::Geometry::get(dc3::Geometry::parse_board_size(args.board),
                                                       dc3::Geometry::parse_ruleset(args.ruleset));
    const dc3::Board initial = dc3::Board::initial(geometry.size(), geometry.ruleset());
    const dc3::WeightVector weights = evaluator_params.get_weights();
    const dc3::Evaluator evaluator(weights);
    std::chrono::milliseconds budget(trainer_params.initial_budget_ms);

    LOG_INFO("Mode {} on {} board, weights {}", args.mode, geometry.name(),
             dc3::Evaluator::weights_to_str(weights));

    if (args.mode == "tune") {
      int seed = random_params.seed ? random_params.seed : util::Random::uniform_sample(1, INT_MAX);
      auto tournament = training::HeuristicTuner::make_tournament(tuner_params, engine_params,
                                                                  runner_params, initial);
      training::HeuristicTuner tuner(tuner_params, weights, tournament, seed);
      dc3::WeightVector best = tuner.run();
      std::cout << dc3::Evaluator::weights_to_str(best) << std::endl;
      return 0;
    }

    search::TranspositionTable table(table_params, geometry);

    if (args.mode == "watch") {
      runner_params.print_game_states = true;
      core::GameRunner runner(runner_params, evaluator);
      generic::EnginePlayer white(engine_params, table, weights);
      generic::EnginePlayer black(engine_params, table, weights);
      white.set_name("white");
      black.set_name("black");
      core::GameRecord record = runner.play(initial, {&white, &black}, budget);
      std::cout << record.to_str() << std::endl;
    } else if (args.mode == "train") {
      generic::EnginePlayer agent0(engine_params, table, weights);
      generic::EnginePlayer agent1(engine_params, table, weights);
      agent0.set_name("agent-0");
      agent1.set_name("agent-1");
      training::SelfPlayTrainer trainer(trainer_params, runner_params, learner_params, table,
                                        evaluator, initial, {&agent0, &agent1});
      active_trainer = &trainer;
      std::signal(SIGINT, signal_handler);
      std::signal(SIGTERM, signal_handler);
      trainer.run();
      active_trainer = nullptr;
    } else if (args.mode == "remote") {
      core::GameRunner runner(runner_params, evaluator);
      generic::EnginePlayer local(engine_params, table, weights);
      generic::RemotePlayer remote(remote_params);
      local.set_name("local");
      remote.set_name("remote");
      core::GameRunner::player_array_t players = {&local, &remote};
      if (args.play_black) std::swap(players[0], players[1]);
      core::GameRecord record = runner.play(initial, players, budget);
      std::cout << record.to_str() << std::endl;
      if (record.finished()) {
        training::OutcomeLearner learner(learner_params, table);
        learner.learn(record);
      }
    } else {
      throw util::CleanException("Unknown --mode \"{}\" (expected watch, train, tune or remote)",
                                 args.mode);
    }

    table.flush();
    return 0;
  } catch (const util::CleanException& e) {
    std::cerr << "Caught a CleanException: ";
    std::cerr << e.what() << std::endl;
    return 1;
  }
}
