#include "minimax/AlphaBetaEngine.hpp"

#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"

#include <chrono>
#include <utility>

namespace minimax {

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
AlphaBetaEngine<Rule, Evaluator>::AlphaBetaEngine(const Rule& rule, const Evaluator& evaluator,
                                                  const SearchParams& params)
    : rule_(rule), evaluator_(evaluator), params_(params) {
  params_.validate();
}

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
typename AlphaBetaEngine<Rule, Evaluator>::Result AlphaBetaEngine<Rule, Evaluator>::search(
  const Position& position, Actor actor, const CancellationToken* token) const {
  using clock_t = SearchBudget::clock_t;

  clock_t::time_point start = clock_t::now();
  Context context(actor,
                  SearchBudget(start, params_.time_limit_ms, params_.node_limit, token));

  // The root spends one ply on its own legal actions, so that search_depth counts the plies below
  // each candidate move.
  Node root = Node::root(position);
  search_node(context, root, actor, params_.search_depth + 1, Window::full());

  Result result;
  result.payoff = root.payoff();
  result.interrupted = context.interrupted;

  const Node* best = root.retained_child();
  if (best) {
    result.action = best->cause_action();
    result.principal_variation = root.best_line();
  } else {
    // No root child completed: the search was interrupted, every child reached no decision, or
    // the root is terminal. The answer must still be a legal action whenever one exists.
    for (const Action& action : rule_.legal_actions(position, actor)) {
      result.action = action;
      break;
    }
  }

  context.stats.elapsed_ns = util::to_ns(clock_t::now() - start);
  result.stats = context.stats;
  return result;
}

template <concepts::Rule Rule, concepts::Evaluator<typename Rule::Position> Evaluator>
std::optional<typename AlphaBetaEngine<Rule, Evaluator>::Payoff>
AlphaBetaEngine<Rule, Evaluator>::search_node(Context& context, Node& node, Actor mover,
                                              depth_t depth, const Window& window) const {
  DEBUG_ASSERT(window.valid(), "malformed search window at depth {}", depth);

  if (context.budget.exhausted(context.stats.nodes_visited)) {
    context.interrupted = true;
    return std::nullopt;
  }
  context.stats.nodes_visited++;

  const Position& position = node.position();
  if (depth == 0 || rule_.is_terminal(position)) {
    Payoff payoff = evaluator_.score_for(context.searcher, position);
    context.stats.leaves_evaluated++;
    node.set_payoff(payoff);
    return payoff;
  }

  const bool maximizing = mover == context.searcher;
  Window current = window;

  for (const Action& action : rule_.legal_actions(position, mover)) {
    DEBUG_ASSERT(action.actor() == mover, "legal action of {} tagged with {}",
                 actor_to_str(mover), actor_to_str(action.actor()));

    Node child(rule_.apply(position, action), action);
    std::optional<Payoff> child_payoff =
      search_node(context, child, opponent(action.actor()), depth - 1, current);

    if (context.interrupted) break;  // child_payoff covers an incomplete subtree
    if (!child_payoff) continue;

    const std::optional<Payoff>& best = node.payoff();
    bool improved = !best || (maximizing ? *best < *child_payoff : *child_payoff < *best);
    if (!improved) continue;

    node.set_payoff(*child_payoff);
    node.retain(std::move(child));

    if (!params_.enable_pruning) continue;

    std::optional<Window> narrowed =
      maximizing ? current.raise_lo(*child_payoff) : current.lower_hi(*child_payoff);
    if (!narrowed) {
      context.stats.cutoffs++;
      break;
    }
    current = *narrowed;
  }

  if (context.interrupted) return std::nullopt;

  if (!node.payoff()) {
    // no legal action, or no child reached a decision
    context.stats.no_decision_nodes++;
  }
  return node.payoff();
}

}  // namespace minimax
