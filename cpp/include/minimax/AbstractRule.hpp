#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Action.hpp"

#include <vector>

namespace minimax {

/*
 * Virtual-interface form of the concepts::Rule contract, for callers that choose the rules of the
 * game at runtime. AbstractRule<Position, Action> itself satisfies concepts::Rule, so an engine
 * instantiated with it dispatches through the vtable on every call.
 *
 * Statically known rules should not derive from this class.
 */
template <typename Position_, concepts::Action Action_>
class AbstractRule {
 public:
  using Position = Position_;
  using Action = Action_;
  using ActionList = std::vector<Action>;

  virtual ~AbstractRule() = default;

  virtual bool is_terminal(const Position& position) const = 0;

  // The enumeration order is the engine's tie-break order.
  virtual ActionList legal_actions(const Position& position, Actor actor) const = 0;

  // Requires action to be legal. See concepts::Rule.
  virtual Position apply(const Position& position, const Action& action) const = 0;
};

}  // namespace minimax
