#include "minimax/StrategyFactory.hpp"

#include "util/CppUtil.hpp"
#include "util/Exception.hpp"

namespace minimax {

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
strategy_ptr_t<Rule> make_strategy(const Rule& rule, const Evaluator& evaluator,
                                   const SearchParams& params) {
  using Position = Rule::Position;
  using Payoff = Evaluator::Payoff;

  switch (params.variant) {
    case kAlphaBeta:
      return std::make_unique<AlphaBetaStrategy<Rule, Evaluator>>(rule, evaluator, params);
    case kNegamax:
      if constexpr (concepts::ZeroSumEvaluator<Evaluator, Position>) {
        return std::make_unique<NegamaxStrategy<Rule, Evaluator>>(rule, evaluator, params);
      } else {
        throw util::CleanException("The Negamax variant requires a negatable payoff type (got {})",
                                   util::get_typename<Payoff>());
      }
    default:
      throw util::Exception("Unknown variant {}", int(params.variant));
  }
}

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
std::optional<typename Rule::Action> select_action(const Rule& rule, const Evaluator& evaluator,
                                                   const typename Rule::Position& position,
                                                   Actor actor, depth_t search_depth) {
  SearchParams params;
  params.search_depth = search_depth;

  AlphaBetaStrategy<Rule, Evaluator> strategy(rule, evaluator, params);
  return strategy.select_action(position, actor);
}

}  // namespace minimax
