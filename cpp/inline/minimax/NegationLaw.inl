#include "minimax/NegationLaw.hpp"

namespace minimax {

template <typename Evaluator, typename Position>
  requires concepts::ZeroSumEvaluator<Evaluator, Position>
bool satisfies_negation_law(const Evaluator& evaluator, const Position& position) {
  using Traits = PayoffTraits<typename Evaluator::Payoff>;

  for (Actor actor : kActors) {
    auto payoff = evaluator.score_for(actor, position);
    auto opponent_payoff = evaluator.score_for(opponent(actor), position);
    if (!(opponent_payoff == Traits::negate(payoff))) return false;
  }
  return true;
}

template <concepts::NegatablePayoff Payoff>
bool is_order_reversing_involution(const std::vector<Payoff>& values) {
  using Traits = PayoffTraits<Payoff>;

  for (const Payoff& x : values) {
    if (!(Traits::negate(Traits::negate(x)) == x)) return false;
    for (const Payoff& y : values) {
      if ((x < y) != (Traits::negate(y) < Traits::negate(x))) return false;
    }
  }
  return true;
}

}  // namespace minimax
