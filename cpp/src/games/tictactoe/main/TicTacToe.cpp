#include "games/tictactoe/Constants.hpp"
#include "games/tictactoe/Game.hpp"
#include "minimax/BasicTypes.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/StrategyFactory.hpp"
#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"
#include "util/LoggingUtil.hpp"
#include "util/Random.hpp"

#include <boost/program_options.hpp>

#include <array>
#include <iostream>
#include <optional>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace po2 = boost_util::program_options;

using Actor = minimax::Actor;
using Board = tictactoe::Board;
using Placement = tictactoe::Placement;
using Rules = tictactoe::Rules;
using IO = tictactoe::IO;
using strategy_ptr_t = minimax::strategy_ptr_t<Rules>;

struct Args {
  std::string human_seat;
  int random_opening_plies = 0;
  bool ordinal = false;

  auto make_options_description() {
    po2::options_description desc("TicTacToe options");

    return desc
      .template add_option<"human-seat", 's'>(
        po::value<std::string>(&human_seat),
        "seat of the human player (First or Second). Default: no human, engine plays both seats")
      .template add_option<"random-opening-plies", 'r'>(
        po::value<int>(&random_opening_plies)->default_value(random_opening_plies),
        "number of uniformly random plies played before the engines take over")
      .template add_flag<"ordinal-eval", "score-eval">(
        &ordinal, "evaluate boards on the ordinal Evaluation scale",
        "evaluate boards with integer scores");
  }
};

Placement prompt_human(const Board& board, Actor actor) {
  while (true) {
    std::cout << "Enter a cell for " << minimax::actor_to_str(actor) << ": " << std::flush;
    std::string line;
    if (!std::getline(std::cin, line)) {
      throw util::CleanException("Input closed before the game ended");
    }

    std::optional<int> cell = IO::parse_cell(line);
    if (cell && Rules::is_legal(board, Placement(*cell, actor))) {
      return Placement(*cell, actor);
    }
    std::cout << "Invalid cell: \"" << line << "\"" << std::endl;
  }
}

Placement random_placement(const Board& board, Actor actor) {
  std::vector<Placement> actions = Rules::legal_actions(board, actor);
  return actions[util::Random::uniform_sample(0, int(actions.size()))];
}

template <typename Evaluator>
int run(const Args& args, const minimax::SearchParams& search_params) {
  Rules rules;
  Evaluator evaluator;

  std::optional<Actor> human;
  if (!args.human_seat.empty()) {
    human = minimax::parse_actor(args.human_seat);
  }

  std::array<strategy_ptr_t, minimax::kActors.size()> strategies;
  for (Actor actor : minimax::kActors) {
    if (actor != human) {
      strategies[(int)actor] = minimax::make_strategy(rules, evaluator, search_params);
    }
  }

  Board board;
  for (int ply = 0; !Rules::is_terminal(board); ++ply) {
    Actor actor = board.actor_to_move();
    IO::print_board(std::cout, board);

    std::optional<Placement> placement;
    if (actor == human) {
      placement = prompt_human(board, actor);
    } else if (ply < args.random_opening_plies) {
      placement = random_placement(board, actor);
    } else {
      placement = strategies[(int)actor]->select_action(board, actor);
    }

    // legal_actions() is non-empty at a non-terminal board for the actor to move
    RELEASE_ASSERT(placement.has_value(), "no action for {}", minimax::actor_to_str(actor));
    std::cout << minimax::actor_to_str(actor) << " plays " << placement->cell() << std::endl;
    board = Rules::apply(board, *placement);
  }

  IO::print_board(std::cout, board);
  std::optional<Actor> winner = board.winner();
  if (!winner) {
    std::cout << "The game has ended in a draw!" << std::endl;
  } else if (human) {
    std::cout << (*winner == *human ? "Congratulations, you win!" : "Sorry! You lose!")
              << std::endl;
  } else {
    std::cout << minimax::actor_to_str(*winner) << " wins!" << std::endl;
  }

  for (const strategy_ptr_t& strategy : strategies) {
    if (strategy) strategy->end_game(board);
  }
  return 0;
}

int main(int ac, char* av[]) {
  try {
    util::Logging::Params log_params;
    util::Random::Params random_params;
    minimax::SearchParams search_params;
    Args args;

    po2::options_description raw_desc("General options");
    auto desc = raw_desc.template add_option<"help", 'h'>("help (most used options)")
                  .template add_option<"help-full">("help (all options)")
                  .add(log_params.make_options_description())
                  .add(random_params.make_options_description())
                  .add(search_params.make_options_description())
                  .add(args.make_options_description());

    po::variables_map vm = po2::parse_args(desc, ac, av);

    if (vm.count("help") || vm.count("help-full")) {
      po2::Settings::help_full = vm.count("help-full");
      std::cout << desc << std::endl;
      return 0;
    }

    util::Logging::init(log_params);
    util::Random::init(random_params);
    search_params.validate();
    CLEAN_ASSERT(args.random_opening_plies >= 0, "--random-opening-plies must be non-negative");

    if (args.ordinal) {
      return run<tictactoe::OrdinalEvaluator>(args, search_params);
    }
    return run<tictactoe::ScoreEvaluator>(args, search_params);
  } catch (const util::CleanException& e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }
}
