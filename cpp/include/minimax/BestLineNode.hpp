#pragma once

#include "minimax/PositionHolder.hpp"
#include "minimax/concepts/Action.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <memory>
#include <optional>
#include <vector>

namespace minimax {

/*
 * Search-tree node of the alpha-beta variant.
 *
 * A node retains at most one child: the best continuation found so far. Retaining a new child
 * destroys the previously retained subtree, so the live tree is a single line of at most
 * (depth + 1) nodes at any time.
 *
 * An unset payoff after the node has been searched means that the node was not terminal, the
 * depth was not exhausted, and no child could be scored ("no decision").
 */
template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
class BestLineNode {
 public:
  // The root borrows the caller's position and has no cause action.
  static BestLineNode root(const Position& position);

  BestLineNode(Position&& position, const Action& cause_action);

  BestLineNode(BestLineNode&&) = default;
  BestLineNode& operator=(BestLineNode&&) = default;

  const Position& position() const { return position_.get(); }
  const std::optional<Action>& cause_action() const { return cause_action_; }
  const std::optional<Payoff>& payoff() const { return payoff_; }
  void set_payoff(const Payoff& payoff) { payoff_ = payoff; }

  const BestLineNode* retained_child() const { return child_.get(); }

  // Replaces the retained child, discarding the previous one along with its whole subtree.
  void retain(BestLineNode&& child);

  // Cause actions along the retained line, starting with the retained child's.
  std::vector<Action> best_line() const;

 private:
  BestLineNode(PositionHolder<Position>&& position, const std::optional<Action>& cause_action)
      : position_(std::move(position)), cause_action_(cause_action) {}

  PositionHolder<Position> position_;
  std::optional<Action> cause_action_;
  std::optional<Payoff> payoff_;
  std::unique_ptr<BestLineNode> child_;
};

}  // namespace minimax

#include "inline/minimax/BestLineNode.inl"
