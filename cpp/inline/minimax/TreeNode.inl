#include "minimax/TreeNode.hpp"

namespace minimax {

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
TreeNode<Position, Action, Payoff> TreeNode<Position, Action, Payoff>::root(
  const Position& position) {
  return TreeNode(PositionHolder<Position>::borrow(position), std::nullopt);
}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
TreeNode<Position, Action, Payoff>::TreeNode(Position&& position, const Action& cause_action)
    : TreeNode(PositionHolder<Position>::own(std::move(position)), cause_action) {}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
int TreeNode<Position, Action, Payoff>::add_child(TreeNode&& child) {
  children_.push_back(std::move(child));
  return children_.size() - 1;
}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
const TreeNode<Position, Action, Payoff>* TreeNode<Position, Action, Payoff>::best_child() const {
  if (best_child_index_ < 0) return nullptr;
  return &children_[best_child_index_];
}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
std::vector<Action> TreeNode<Position, Action, Payoff>::best_line() const {
  std::vector<Action> line;
  for (const TreeNode* node = best_child(); node; node = node->best_child()) {
    line.push_back(*node->cause_action_);
  }
  return line;
}

}  // namespace minimax
