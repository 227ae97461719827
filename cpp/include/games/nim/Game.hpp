#pragma once

#include "games/nim/Constants.hpp"
#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <compare>
#include <ostream>
#include <string>
#include <vector>

/*
 * Subtraction game: the actors alternately take between 1 and kMaxStonesToTake stones from a
 * single pile, and the actor that takes the last stone wins.
 *
 * The game is small enough that every position can be enumerated, which makes it a convenient
 * reference for exhaustive engine checks.
 */
namespace nim {

struct State {
  auto operator<=>(const State& other) const = default;

  int stones_left = kStartingStones;
  minimax::Actor actor_to_move = minimax::Actor::kFirst;
};

class Take {
 public:
  Take(int stones, minimax::Actor actor) : stones_(stones), actor_(actor) {}

  bool operator==(const Take& other) const = default;

  int stones() const { return stones_; }
  minimax::Actor actor() const { return actor_; }

 private:
  int stones_;
  minimax::Actor actor_;
};

std::ostream& operator<<(std::ostream& os, const Take& take);

struct Rules {
  using Position = State;
  using Action = Take;

  static bool is_terminal(const State& state) { return state.stones_left == 0; }

  // Take 1, Take 2, ... in that order. Empty if the game is over or if it is not actor's turn.
  static std::vector<Take> legal_actions(const State& state, minimax::Actor actor);

  // Throws util::ReleaseAssertionError if take is illegal.
  static State apply(const State& state, const Take& take);
};

/*
 * +kWinScore for the actor that took the last stone, -kWinScore for the other one, and 0 for
 * every unfinished game.
 */
struct Evaluator {
  using Payoff = int;

  static int score_for(minimax::Actor actor, const State& state);
};

struct IO {
  // "[stones_left, actor_to_move]"
  static std::string compact_repr(const State& state);
};

}  // namespace nim

static_assert(minimax::concepts::Rule<nim::Rules>);
static_assert(minimax::concepts::ZeroSumEvaluator<nim::Evaluator, nim::State>);

#include "inline/games/nim/Game.inl"
