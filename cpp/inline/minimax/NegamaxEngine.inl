#include "minimax/NegamaxEngine.hpp"

#include "util/Asserts.hpp"
#include "util/CppUtil.hpp"

#include <chrono>
#include <utility>

namespace minimax {

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
NegamaxEngine<Rule, Evaluator>::NegamaxEngine(const Rule& rule, const Evaluator& evaluator,
                                              const SearchParams& params)
    : rule_(rule), evaluator_(evaluator), params_(params) {
  params_.validate();
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
typename NegamaxEngine<Rule, Evaluator>::Result NegamaxEngine<Rule, Evaluator>::search(
  const Position& position, Actor actor, const CancellationToken* token) const {
  using clock_t = SearchBudget::clock_t;

  clock_t::time_point start = clock_t::now();
  Context context(SearchBudget(start, params_.time_limit_ms, params_.node_limit, token));

  Node root = Node::root(position);
  search_node(context, root, actor, params_.search_depth + 1, Window::full());

  Result result;
  result.payoff = root.payoff();  // the root's mover is the searching actor
  result.interrupted = context.interrupted;

  // Searched children form a prefix of the legal actions, in enumeration order.
  const auto& children = root.children();
  size_t i = 0;
  for (const Action& action : rule_.legal_actions(position, actor)) {
    std::optional<Payoff> payoff;
    if (i < children.size() && children[i].payoff()) {
      payoff = Traits::negate(*children[i].payoff());
    }
    result.root_children.push_back({action, payoff});
    ++i;
  }

  const Node* best = root.best_child();
  if (best) {
    result.action = best->cause_action();
    result.principal_variation = root.best_line();
  } else if (!result.root_children.empty()) {
    result.action = result.root_children.front().action;
  }

  context.stats.elapsed_ns = util::to_ns(clock_t::now() - start);
  result.stats = context.stats;
  return result;
}

template <concepts::Rule Rule, concepts::ZeroSumEvaluator<typename Rule::Position> Evaluator>
std::optional<typename NegamaxEngine<Rule, Evaluator>::Payoff>
NegamaxEngine<Rule, Evaluator>::search_node(Context& context, Node& node, Actor mover,
                                            depth_t depth, const Window& window) const {
  DEBUG_ASSERT(window.valid(), "malformed search window at depth {}", depth);

  if (context.budget.exhausted(context.stats.nodes_visited)) {
    context.interrupted = true;
    return std::nullopt;
  }
  context.stats.nodes_visited++;

  const Position& position = node.position();
  if (depth == 0 || rule_.is_terminal(position)) {
    Payoff payoff = evaluator_.score_for(mover, position);
    DEBUG_ASSERT(evaluator_.score_for(opponent(mover), position) == Traits::negate(payoff),
                 "evaluator violates the zero-sum law");
    context.stats.leaves_evaluated++;
    node.set_payoff(payoff);
    return payoff;
  }

  Window current = window;

  for (const Action& action : rule_.legal_actions(position, mover)) {
    DEBUG_ASSERT(action.actor() == mover, "legal action of {} tagged with {}",
                 actor_to_str(mover), actor_to_str(action.actor()));

    Node child(rule_.apply(position, action), action);
    std::optional<Payoff> child_payoff =
      search_node(context, child, opponent(action.actor()), depth - 1, current.negated());

    if (context.interrupted) break;
    int index = node.add_child(std::move(child));
    if (!child_payoff) continue;

    Payoff payoff = Traits::negate(*child_payoff);
    const std::optional<Payoff>& best = node.payoff();
    if (best && !(*best < payoff)) continue;

    node.set_payoff(payoff);
    node.set_best_child(index);

    if (!params_.enable_pruning) continue;

    std::optional<Window> narrowed = current.raise_lo(payoff);
    if (!narrowed) {
      context.stats.cutoffs++;
      break;
    }
    current = *narrowed;
  }

  if (context.interrupted) return std::nullopt;

  if (!node.payoff()) {
    context.stats.no_decision_nodes++;
  }
  return node.payoff();
}

}  // namespace minimax
