#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <optional>
#include <vector>

/*
 * This file contains unit-testing code that can be shared by the tests of all games.
 */

namespace minimax {
namespace tests {

template <typename Position>
struct SearchRoot {
  Position position;
  Actor actor;
};

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
struct Common {
  using Position = Rule::Position;
  using Action = Rule::Action;
  using Payoff = Evaluator::Payoff;
  using Root = SearchRoot<Position>;

  struct BruteForceResult {
    std::optional<Action> action;
    std::optional<Payoff> payoff;
  };

  /*
   * Plain recursive minimax over the full width of the tree, with the first-found tie-break and
   * the root-depth convention of the engines. Serves as an engine-independent reference.
   */
  static BruteForceResult brute_force(const Rule& rule, const Evaluator& evaluator,
                                      const Root& root, depth_t search_depth);

  /*
   * For every root, checks that both engines, with pruning enabled and disabled, choose the same
   * action with the same root payoff as brute_force(). Also checks that pruning never visits more
   * nodes than full-width search.
   */
  static void gtest_pruning_equivalence(const Rule& rule, const Evaluator& evaluator,
                                        const std::vector<Root>& roots, depth_t search_depth);

  /*
   * For every root, checks that NegamaxEngine and AlphaBetaEngine, given the same params, explore
   * the same tree: same action, root payoff, principal variation, node count and cutoff count.
   */
  static void gtest_negamax_equivalence(const Rule& rule, const Evaluator& evaluator,
                                        const std::vector<Root>& roots, depth_t search_depth);

  /*
   * For every root:
   *
   * - select_action() returns none iff the rule lists no legal action for the root's actor;
   * - otherwise the returned action is one of the legal actions;
   * - repeated calls return the same action.
   */
  static void gtest_select_action_contract(const Rule& rule, const Evaluator& evaluator,
                                           const std::vector<Root>& roots, depth_t search_depth);

  // Checks satisfies_negation_law() at every root position.
  static void gtest_negation_law(const Evaluator& evaluator, const std::vector<Root>& roots);

 private:
  static std::optional<Payoff> brute_force_value(const Rule& rule, const Evaluator& evaluator,
                                                 const Position& position, Actor mover,
                                                 Actor searcher, depth_t depth);
};

}  // namespace tests
}  // namespace minimax

#include "inline/minimax/tests/Common.inl"
