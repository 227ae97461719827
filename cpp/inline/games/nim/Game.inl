#include "games/nim/Game.hpp"

#include "util/Asserts.hpp"

#include <fmt/format.h>

#include <algorithm>

namespace nim {

inline std::ostream& operator<<(std::ostream& os, const Take& take) {
  return os << "take" << take.stones();
}

inline std::vector<Take> Rules::legal_actions(const State& state, minimax::Actor actor) {
  std::vector<Take> actions;
  if (actor != state.actor_to_move) return actions;

  int max_stones = std::min(kMaxStonesToTake, state.stones_left);
  for (int stones = 1; stones <= max_stones; ++stones) {
    actions.emplace_back(stones, actor);
  }
  return actions;
}

inline State Rules::apply(const State& state, const Take& take) {
  RELEASE_ASSERT(take.actor() == state.actor_to_move, "Illegal take: not {}'s turn in {}",
                 minimax::actor_to_str(take.actor()), IO::compact_repr(state));
  int max_stones = std::min(kMaxStonesToTake, state.stones_left);
  RELEASE_ASSERT(take.stones() >= 1 && take.stones() <= max_stones,
                 "Illegal take of {} stones in {}", take.stones(), IO::compact_repr(state));

  State next;
  next.stones_left = state.stones_left - take.stones();
  next.actor_to_move = minimax::opponent(state.actor_to_move);
  return next;
}

inline int Evaluator::score_for(minimax::Actor actor, const State& state) {
  if (!Rules::is_terminal(state)) return 0;

  // the actor to move at a terminal state is the one that did not take the last stone
  return state.actor_to_move == actor ? -kWinScore : kWinScore;
}

inline std::string IO::compact_repr(const State& state) {
  return fmt::format("[{}, {}]", state.stones_left, minimax::actor_to_str(state.actor_to_move));
}

}  // namespace nim
