#pragma once

#include "minimax/BasicTypes.hpp"

#include <optional>
#include <string>

namespace minimax {

/*
 * Base class for all move-selection strategies.
 *
 * select_action() returns std::nullopt iff actor has no legal action at position. Otherwise the
 * returned action is one of the rule's legal actions for actor.
 *
 * Drivers hold strategies through this interface, so that the search variant can be picked at
 * runtime (see make_strategy()).
 */
template <typename Position, typename Action>
class AbstractStrategy {
 public:
  virtual ~AbstractStrategy() = default;

  virtual std::string get_name() const = 0;
  virtual std::optional<Action> select_action(const Position& position, Actor actor) = 0;

  // Called once by the driver when a game ends at position.
  virtual void end_game(const Position&) {}
};

}  // namespace minimax
