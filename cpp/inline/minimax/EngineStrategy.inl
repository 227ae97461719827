#include "minimax/EngineStrategy.hpp"

#include "util/LoggingUtil.hpp"

#include <fmt/format.h>

#include <ostream>
#include <sstream>

namespace minimax {

namespace detail {

// Actions and payoffs are opaque to the engine. They are logged if they happen to be streamable.
template <typename T>
std::string repr(const T& t) {
  if constexpr (requires(std::ostream& os) { os << t; }) {
    std::ostringstream ss;
    ss << t;
    return ss.str();
  } else {
    return "?";
  }
}

template <typename T>
std::string repr(const std::optional<T>& t) {
  return t ? repr(*t) : "none";
}

}  // namespace detail

template <typename Engine>
EngineStrategy<Engine>::EngineStrategy(const Rule& rule, const Evaluator& evaluator,
                                       const SearchParams& params)
    : engine_(rule, evaluator, params) {}

template <typename Engine>
std::string EngineStrategy<Engine>::get_name() const {
  return fmt::format("{}-d{}", variant_to_str(Engine::kVariant), engine_.params().search_depth);
}

template <typename Engine>
std::optional<typename EngineStrategy<Engine>::Action> EngineStrategy<Engine>::select_action(
  const Position& position, Actor actor) {
  Result result = engine_.search(position, actor, token_);
  cumulative_stats_ += result.stats;
  log_result(actor, result);

  last_result_ = std::move(result);
  return last_result_->action;
}

template <typename Engine>
void EngineStrategy<Engine>::end_game(const Position&) {
  LOG_INFO("{} totals: {}", get_name(), cumulative_stats_.to_str());
}

template <typename Engine>
void EngineStrategy<Engine>::log_result(Actor actor, const Result& result) const {
  if (result.interrupted) {
    LOG_WARN("{} search for {} interrupted after {} nodes; falling back on {}", get_name(),
             actor_to_str(actor), result.stats.nodes_visited, detail::repr(result.action));
  }

  if (!engine_.params().verbose) {
    LOG_DEBUG("{} {} -> action={} payoff={} {}", get_name(), actor_to_str(actor),
              detail::repr(result.action), detail::repr(result.payoff), result.stats.to_str());
    return;
  }

  LOG_INFO("{} {} -> action={} payoff={} {}", get_name(), actor_to_str(actor),
           detail::repr(result.action), detail::repr(result.payoff), result.stats.to_str());

  std::string line;
  for (const Action& action : result.principal_variation) {
    line += fmt::format(" {}", detail::repr(action));
  }
  LOG_INFO("  principal variation:{}", line);

  for (const auto& child : result.root_children) {
    LOG_INFO("  {:>8} {}", detail::repr(child.action), detail::repr(child.payoff));
  }
}

}  // namespace minimax
