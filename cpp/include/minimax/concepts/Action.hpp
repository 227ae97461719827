#pragma once

#include "minimax/BasicTypes.hpp"

#include <concepts>

namespace minimax {
namespace concepts {

// An action is an opaque, copyable value tagged with the actor that takes it.
template <typename A>
concept Action = std::copyable<A> && requires(const A& a) {
  { a.actor() } -> std::same_as<Actor>;
};

}  // namespace concepts
}  // namespace minimax
