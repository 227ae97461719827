#include "minimax/tests/Common.hpp"

#include "minimax/AlphaBetaEngine.hpp"
#include "minimax/NegamaxEngine.hpp"
#include "minimax/NegationLaw.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/StrategyFactory.hpp"

#include <gtest/gtest.h>

#include <algorithm>

namespace minimax {
namespace tests {

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
typename Common<Rule, Evaluator>::BruteForceResult Common<Rule, Evaluator>::brute_force(
  const Rule& rule, const Evaluator& evaluator, const Root& root, depth_t search_depth) {
  BruteForceResult result;
  if (rule.is_terminal(root.position)) {
    for (const Action& action : rule.legal_actions(root.position, root.actor)) {
      result.action = action;
      break;
    }
    result.payoff = evaluator.score_for(root.actor, root.position);
    return result;
  }

  for (const Action& action : rule.legal_actions(root.position, root.actor)) {
    if (!result.action) result.action = action;
    Position child = rule.apply(root.position, action);
    std::optional<Payoff> payoff = brute_force_value(rule, evaluator, child, opponent(root.actor),
                                                     root.actor, search_depth);
    if (!payoff) continue;
    if (!result.payoff || *result.payoff < *payoff) {
      result.action = action;
      result.payoff = payoff;
    }
  }
  return result;
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
std::optional<typename Common<Rule, Evaluator>::Payoff>
Common<Rule, Evaluator>::brute_force_value(const Rule& rule, const Evaluator& evaluator,
                                           const Position& position, Actor mover, Actor searcher,
                                           depth_t depth) {
  if (depth == 0 || rule.is_terminal(position)) {
    return evaluator.score_for(searcher, position);
  }

  std::optional<Payoff> best;
  for (const Action& action : rule.legal_actions(position, mover)) {
    Position child = rule.apply(position, action);
    std::optional<Payoff> payoff =
      brute_force_value(rule, evaluator, child, opponent(mover), searcher, depth - 1);
    if (!payoff) continue;
    if (!best || (mover == searcher ? *best < *payoff : *payoff < *best)) {
      best = payoff;
    }
  }
  return best;
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
void Common<Rule, Evaluator>::gtest_pruning_equivalence(const Rule& rule,
                                                        const Evaluator& evaluator,
                                                        const std::vector<Root>& roots,
                                                        depth_t search_depth) {
  SearchParams pruned_params;
  pruned_params.search_depth = search_depth;
  SearchParams full_params = pruned_params;
  full_params.enable_pruning = false;

  AlphaBetaEngine<Rule, Evaluator> pruned(rule, evaluator, pruned_params);
  AlphaBetaEngine<Rule, Evaluator> full(rule, evaluator, full_params);
  NegamaxEngine<Rule, Evaluator> negamax_pruned(rule, evaluator, pruned_params);
  NegamaxEngine<Rule, Evaluator> negamax_full(rule, evaluator, full_params);

  for (const Root& root : roots) {
    BruteForceResult expected = brute_force(rule, evaluator, root, search_depth);

    auto pruned_result = pruned.search(root.position, root.actor);
    auto full_result = full.search(root.position, root.actor);
    auto negamax_pruned_result = negamax_pruned.search(root.position, root.actor);
    auto negamax_full_result = negamax_full.search(root.position, root.actor);

    EXPECT_EQ(full_result.action, expected.action);
    EXPECT_EQ(full_result.payoff, expected.payoff);
    EXPECT_EQ(pruned_result.action, expected.action);
    EXPECT_EQ(pruned_result.payoff, expected.payoff);
    EXPECT_EQ(negamax_full_result.action, expected.action);
    EXPECT_EQ(negamax_full_result.payoff, expected.payoff);
    EXPECT_EQ(negamax_pruned_result.action, expected.action);
    EXPECT_EQ(negamax_pruned_result.payoff, expected.payoff);

    EXPECT_EQ(full_result.stats.cutoffs, 0);
    EXPECT_LE(pruned_result.stats.nodes_visited, full_result.stats.nodes_visited);
    EXPECT_FALSE(pruned_result.interrupted);
  }
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
void Common<Rule, Evaluator>::gtest_negamax_equivalence(const Rule& rule,
                                                        const Evaluator& evaluator,
                                                        const std::vector<Root>& roots,
                                                        depth_t search_depth) {
  for (bool enable_pruning : {true, false}) {
    SearchParams params;
    params.search_depth = search_depth;
    params.enable_pruning = enable_pruning;

    AlphaBetaEngine<Rule, Evaluator> alpha_beta(rule, evaluator, params);
    NegamaxEngine<Rule, Evaluator> negamax(rule, evaluator, params);

    for (const Root& root : roots) {
      auto expected = alpha_beta.search(root.position, root.actor);
      auto actual = negamax.search(root.position, root.actor);

      EXPECT_EQ(actual.action, expected.action);
      EXPECT_EQ(actual.payoff, expected.payoff);
      EXPECT_EQ(actual.principal_variation, expected.principal_variation);
      EXPECT_EQ(actual.stats.nodes_visited, expected.stats.nodes_visited);
      EXPECT_EQ(actual.stats.leaves_evaluated, expected.stats.leaves_evaluated);
      EXPECT_EQ(actual.stats.cutoffs, expected.stats.cutoffs);
      EXPECT_EQ(actual.stats.no_decision_nodes, expected.stats.no_decision_nodes);

      // the chosen root child carries the root payoff
      for (const auto& child : actual.root_children) {
        if (actual.action && child.action == *actual.action) {
          EXPECT_EQ(child.payoff, actual.payoff);
          break;
        }
      }
    }
  }
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
void Common<Rule, Evaluator>::gtest_select_action_contract(const Rule& rule,
                                                           const Evaluator& evaluator,
                                                           const std::vector<Root>& roots,
                                                           depth_t search_depth) {
  for (const Root& root : roots) {
    std::vector<Action> legal_actions;
    for (const Action& action : rule.legal_actions(root.position, root.actor)) {
      legal_actions.push_back(action);
    }

    std::optional<Action> action =
      select_action(rule, evaluator, root.position, root.actor, search_depth);

    EXPECT_EQ(action.has_value(), !legal_actions.empty());
    if (action) {
      EXPECT_NE(std::find(legal_actions.begin(), legal_actions.end(), *action),
                legal_actions.end());
    }

    std::optional<Action> action2 =
      select_action(rule, evaluator, root.position, root.actor, search_depth);
    EXPECT_EQ(action, action2);
  }
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
void Common<Rule, Evaluator>::gtest_negation_law(const Evaluator& evaluator,
                                                 const std::vector<Root>& roots) {
  for (const Root& root : roots) {
    EXPECT_TRUE(satisfies_negation_law(evaluator, root.position));
  }
}

}  // namespace tests
}  // namespace minimax
