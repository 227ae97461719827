#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <concepts>

namespace minimax {
namespace concepts {

/*
 * Scores a position for an actor. The engine only calls score_for() on terminal positions and on
 * positions at which the search depth is exhausted.
 */
template <typename E, typename Position>
concept Evaluator = requires(const E& evaluator, Actor actor, const Position& position) {
  typename E::Payoff;
  requires Payoff<typename E::Payoff>;
  { evaluator.score_for(actor, position) } -> std::same_as<typename E::Payoff>;
};

/*
 * An Evaluator usable with the negamax variant. The zero-sum law
 *
 *   score_for(opponent(a), p) == negate(score_for(a, p))
 *
 * must hold for every reachable p. This cannot be expressed as a concept; it is the caller's
 * responsibility, checked at leaves by debug builds and testable via satisfies_negation_law().
 */
template <typename E, typename Position>
concept ZeroSumEvaluator = Evaluator<E, Position> && NegatablePayoff<typename E::Payoff>;

}  // namespace concepts
}  // namespace minimax
