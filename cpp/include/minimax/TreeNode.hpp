#pragma once

#include "minimax/PositionHolder.hpp"
#include "minimax/concepts/Action.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <optional>
#include <vector>

namespace minimax {

/*
 * Search-tree node of the negamax variant.
 *
 * Unlike BestLineNode, a TreeNode keeps every child it searched, in enumeration order, which makes
 * runner-up moves inspectable after the search at the price of O(branching^depth) memory.
 *
 * payoff() is expressed from the perspective of the actor to move at this node.
 */
template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
class TreeNode {
 public:
  static TreeNode root(const Position& position);

  TreeNode(Position&& position, const Action& cause_action);

  TreeNode(TreeNode&&) = default;
  TreeNode& operator=(TreeNode&&) = default;

  const Position& position() const { return position_.get(); }
  const std::optional<Action>& cause_action() const { return cause_action_; }
  const std::optional<Payoff>& payoff() const { return payoff_; }
  void set_payoff(const Payoff& payoff) { payoff_ = payoff; }

  const std::vector<TreeNode>& children() const { return children_; }

  // Appends a searched child. Returns its index.
  int add_child(TreeNode&& child);

  // Marks children()[index] as the best continuation.
  void set_best_child(int index) { best_child_index_ = index; }
  const TreeNode* best_child() const;

  // Cause actions along the chain of best children.
  std::vector<Action> best_line() const;

 private:
  TreeNode(PositionHolder<Position>&& position, const std::optional<Action>& cause_action)
      : position_(std::move(position)), cause_action_(cause_action) {}

  PositionHolder<Position> position_;
  std::optional<Action> cause_action_;
  std::optional<Payoff> payoff_;
  std::vector<TreeNode> children_;
  int best_child_index_ = -1;
};

}  // namespace minimax

#include "inline/minimax/TreeNode.inl"
