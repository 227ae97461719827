#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/BestLineNode.hpp"
#include "minimax/SearchBudget.hpp"
#include "minimax/SearchParams.hpp"
#include "minimax/SearchResult.hpp"
#include "minimax/SearchStats.hpp"
#include "minimax/Window.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <optional>

namespace minimax {

/*
 * Depth-bounded minimax with alpha-beta pruning.
 *
 * Every payoff in the tree is expressed from the perspective of the searching actor: nodes where
 * the searching actor is to move maximize, the other nodes minimize. Each node retains only its
 * best child, so the memory held by a search is proportional to the search depth.
 *
 * Ties between children are broken in favor of the first one enumerated by the rule. The window
 * is narrowed only after a strictly better child is found, and siblings are cut off only once the
 * narrowed window is empty (lo > hi).
 *
 * The engine holds its collaborators by reference; they must outlive it. It carries no state
 * across search() calls, so one instance can be reused for any number of positions.
 */
template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
class AlphaBetaEngine {
 public:
  using Position = Rule::Position;
  using Action = Rule::Action;
  using Payoff = Evaluator::Payoff;
  using Node = BestLineNode<Position, Action, Payoff>;
  using Window = minimax::Window<Payoff>;
  using Result = SearchResult<Action, Payoff>;
  using rule_t = Rule;
  using evaluator_t = Evaluator;

  static constexpr Variant kVariant = kAlphaBeta;

  AlphaBetaEngine(const Rule& rule, const Evaluator& evaluator,
                  const SearchParams& params = SearchParams());

  Result search(const Position& position, Actor actor,
                const CancellationToken* token = nullptr) const;

  const SearchParams& params() const { return params_; }

 private:
  struct Context {
    Context(Actor a, const SearchBudget& b) : searcher(a), budget(b) {}

    const Actor searcher;
    SearchBudget budget;
    SearchStats stats;
    bool interrupted = false;
  };

  /*
   * Searches the subtree rooted at node, where mover is the actor to move and depth the number of
   * plies still allowed. Returns the node's payoff, or std::nullopt if the node reached no
   * decision or the search was interrupted (see Context::interrupted).
   */
  std::optional<Payoff> search_node(Context& context, Node& node, Actor mover, depth_t depth,
                                    const Window& window) const;

  const Rule& rule_;
  const Evaluator& evaluator_;
  const SearchParams params_;
};

}  // namespace minimax

#include "inline/minimax/AlphaBetaEngine.inl"
