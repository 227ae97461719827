#pragma once

#include "minimax/BasicTypes.hpp"
#include "minimax/concepts/Action.hpp"

#include <concepts>
#include <ranges>

namespace minimax {
namespace concepts {

/*
 * The transition model of a game.
 *
 * - legal_actions(position, actor) enumerates the actions available to actor. The enumeration
 *   order is the engine's tie-break order. It may be empty.
 *
 * - apply(position, action) returns the successor position as a new value. The behavior is
 *   undefined unless action is a member of legal_actions(position, action.actor()); rules are
 *   expected to RELEASE_ASSERT() this.
 *
 * - is_terminal(position) reports whether the game has ended.
 *
 * The members may be static; the engine invokes them through a const reference, so virtual
 * members (see AbstractRule) satisfy the concept too.
 */
template <typename R>
concept Rule = requires(const R& rule, const typename R::Position& position,
                        const typename R::Action& action, Actor actor) {
  requires Action<typename R::Action>;
  requires std::move_constructible<typename R::Position>;
  { rule.is_terminal(position) } -> std::same_as<bool>;
  { rule.legal_actions(position, actor) } -> std::ranges::input_range;
  requires std::convertible_to<
    std::ranges::range_reference_t<decltype(rule.legal_actions(position, actor))>,
    typename R::Action>;
  { rule.apply(position, action) } -> std::same_as<typename R::Position>;
};

}  // namespace concepts
}  // namespace minimax
