#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/PayoffTraits.hpp"
#include "minimax/SearchBudget.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/SearchResult.hpp"
#include "minimax/SearchStats.hpp"
#include "minimax/TreeNode.hpp"
#include "minimax/Window.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <optional>

namespace minimax {

/*
 * Negamax formulation of AlphaBetaEngine.
 *
 * Each node's payoff is expressed from the perspective of the actor to move there. A child is
 * searched with the negated window, and its payoff is negated before being compared with the
 * running best, so every node maximizes and there is a single code path for both actors.
 *
 * Provided that the evaluator satisfies the zero-sum law (see concepts::ZeroSumEvaluator), the
 * chosen action, the principal variation, and the root payoff are identical to those of
 * AlphaBetaEngine with the same params. Debug builds check the law at every leaf.
 *
 * Every searched child is kept in the tree (see TreeNode), and the scores of the root children are
 * reported in SearchResult::root_children.
 */
template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
class NegamaxEngine {
 public:
  using Position = Rule::Position;
  using Action = Rule::Action;
  using Payoff = Evaluator::Payoff;
  using Traits = PayoffTraits<Payoff>;
  using Node = TreeNode<Position, Action, Payoff>;
  using Window = minimax::Window<Payoff>;
  using Result = SearchResult<Action, Payoff>;
  using rule_t = Rule;
  using evaluator_t = Evaluator;

  static constexpr Variant kVariant = kNegamax;

  NegamaxEngine(const Rule& rule, const Evaluator& evaluator,
                const SearchParams& params = SearchParams());

  Result search(const Position& position, Actor actor,
                const CancellationToken* token = nullptr) const;

  const SearchParams& params() const { return params_; }

 private:
  struct Context {
    Context(const SearchBudget& b) : budget(b) {}

    SearchBudget budget;
    SearchStats stats;
    bool interrupted = false;
  };

  // Returns node's payoff from mover's perspective. See AlphaBetaEngine::search_node().
  std::optional<Payoff> search_node(Context& context, Node& node, Actor mover, depth_t depth,
                                    const Window& window) const;

  const Rule& rule_;
  const Evaluator& evaluator_;
  const SearchParams params_;
};

}  // namespace minimax

#include "inline/minimax/NegamaxEngine.inl"
