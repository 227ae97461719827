#pragma once

#include "minimax/AbstractStrategy.hpp"
#include "minimax/AlphaBetaEngine.hpp"
#include "minimax/BasicTypes.hpp"
#include "minimax/NegamaxEngine.hpp"
#include "minimax/SearchBudget.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/SearchStats.hpp"

#include <optional>
#include <string>

namespace minimax {

/*
 * An AbstractStrategy backed by a search engine (AlphaBetaEngine or NegamaxEngine).
 *
 * Every call to select_action() runs one independent search. The strategy accumulates the stats of
 * its searches, and keeps the full result of the last one for inspection, but neither influences
 * later searches.
 *
 * A cancellation token can be attached with set_cancellation_token(). It is polled by every search
 * of this strategy, and it is the caller's job to reset() it between searches.
 */
template <typename Engine>
class EngineStrategy : public AbstractStrategy<typename Engine::Position, typename Engine::Action> {
 public:
  using Position = Engine::Position;
  using Action = Engine::Action;
  using Result = Engine::Result;
  using Rule = Engine::rule_t;
  using Evaluator = Engine::evaluator_t;

  EngineStrategy(const Rule& rule, const Evaluator& evaluator,
                 const SearchParams& params = SearchParams());

  std::string get_name() const override;
  std::optional<Action> select_action(const Position& position, Actor actor) override;

  // Logs cumulative_stats().
  void end_game(const Position&) override;

  void set_cancellation_token(const CancellationToken* token) { token_ = token; }

  const std::optional<Result>& last_result() const { return last_result_; }
  const SearchStats& cumulative_stats() const { return cumulative_stats_; }

 private:
  void log_result(Actor actor, const Result& result) const;

  const Engine engine_;
  const CancellationToken* token_ = nullptr;
  std::optional<Result> last_result_;
  SearchStats cumulative_stats_;
};

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
using AlphaBetaStrategy = EngineStrategy<AlphaBetaEngine<Rule, Evaluator>>;

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
using NegamaxStrategy = EngineStrategy<NegamaxEngine<Rule, Evaluator>>;

}  // namespace minimax

#include "inline/minimax/EngineStrategy.inl"
