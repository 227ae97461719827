#include "minimax/BestLineNode.hpp"

namespace minimax {

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
BestLineNode<Position, Action, Payoff> BestLineNode<Position, Action, Payoff>::root(
  const Position& position) {
  return BestLineNode(PositionHolder<Position>::borrow(position), std::nullopt);
}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
BestLineNode<Position, Action, Payoff>::BestLineNode(Position&& position,
                                                     const Action& cause_action)
    : BestLineNode(PositionHolder<Position>::own(std::move(position)), cause_action) {}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
void BestLineNode<Position, Action, Payoff>::retain(BestLineNode&& child) {
  child_ = std::make_unique<BestLineNode>(std::move(child));
}

template <typename Position, concepts::Action Action, concepts::Payoff Payoff>
std::vector<Action> BestLineNode<Position, Action, Payoff>::best_line() const {
  std::vector<Action> line;
  for (const BestLineNode* node = child_.get(); node; node = node->child_.get()) {
    line.push_back(*node->cause_action_);
  }
  return line;
}

}  // namespace minimax
