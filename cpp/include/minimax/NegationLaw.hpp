#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/PayoffTraits.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <vector>

namespace minimax {

/*
 * Returns true iff evaluator obeys the zero-sum law at position:
 *
 *   score_for(opponent(a), position) == negate(score_for(a, position)) for both actors a.
 *
 * The negamax variant silently picks wrong actions for evaluators that fail this check.
 */
template <typename Evaluator, typename Position>
  requires concepts::ZeroSumEvaluator<Evaluator, Position>
bool satisfies_negation_law(const Evaluator& evaluator, const Position& position);

/*
 * Returns true iff PayoffTraits<Payoff>::negate() is an order-reversing involution on values:
 *
 *   negate(negate(x)) == x for every x, and x < y iff negate(y) < negate(x) for every pair.
 *
 * Intended for qualitative payoff scales, whose negate() is an explicit map rather than
 * arithmetic.
 */
template <concepts::NegatablePayoff Payoff>
bool is_order_reversing_involution(const std::vector<Payoff>& values);

}  // namespace minimax

#include "inline/minimax/NegationLaw.inl"
