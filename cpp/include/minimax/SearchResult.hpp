#pragma once

#include "minimax/SearchStats.hpp"
#include "minimax/concepts/Action.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <optional>
#include <vector>

namespace minimax {

// A root action together with its backed-up payoff, from the searching actor's perspective.
template <concepts::Action Action, concepts::Payoff Payoff>
struct ScoredAction {
  Action action;
  std::optional<Payoff> payoff;  // unset if never searched or no decision
};

/*
 * Output of one engine search.
 *
 * action is unset iff the searching actor had no legal action. payoff is the backed-up value of
 * the root from the searching actor's perspective; when interrupted is set, it only reflects the
 * root children whose subtrees completed.
 *
 * principal_variation is filled by both variants. root_children is filled by the negamax variant
 * only, in legal-action enumeration order. With pruning enabled, the payoffs of root children
 * other than the chosen one may be bounds rather than exact values.
 */
template <concepts::Action Action, concepts::Payoff Payoff>
struct SearchResult {
  std::optional<Action> action;
  std::optional<Payoff> payoff;
  std::vector<Action> principal_variation;
  std::vector<ScoredAction<Action, Payoff>> root_children;
  SearchStats stats;
  bool interrupted = false;
};

}  // namespace minimax
