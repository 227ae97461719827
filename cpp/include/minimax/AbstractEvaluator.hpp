#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Payoff.hpp"

namespace minimax {

/*
 * Virtual-interface form of the concepts::Evaluator contract. See AbstractRule.
 *
 * If Payoff is a NegatablePayoff, an AbstractEvaluator also satisfies concepts::ZeroSumEvaluator,
 * and derived classes are responsible for obeying the zero-sum law.
 */
template <typename Position_, concepts::Payoff Payoff_>
class AbstractEvaluator {
 public:
  using Position = Position_;
  using Payoff = Payoff_;

  virtual ~AbstractEvaluator() = default;

  virtual Payoff score_for(Actor actor, const Position& position) const = 0;
};

}  // namespace minimax
