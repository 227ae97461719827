#pragma once

#include "minimax/AbstractStrategy.hpp"
#include "minimax/BasicTypes.hpp"
#include "minimax/EngineStrategy.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <memory>
#include <optional>

namespace minimax {

template <concepts::Rule Rule>
using strategy_ptr_t =
  std::unique_ptr<AbstractStrategy<typename Rule::Position, typename Rule::Action>>;

/*
 * Constructs the strategy selected by params.variant.
 *
 * Throws util::CleanException if params fail validation, or if the negamax variant is requested
 * with an evaluator whose payoff type has no negation.
 */
template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
strategy_ptr_t<Rule> make_strategy(const Rule& rule, const Evaluator& evaluator,
                                   const SearchParams& params);

/*
 * Returns the best action for actor at position, searching search_depth plies below each candidate
 * action with the alpha-beta variant and no budget. Returns std::nullopt iff actor has no legal
 * action.
 */
template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
std::optional<typename Rule::Action> select_action(const Rule& rule, const Evaluator& evaluator,
                                                   const typename Rule::Position& position,
                                                   Actor actor, depth_t search_depth);

}  // namespace minimax

#include "inline/minimax/StrategyFactory.inl"
