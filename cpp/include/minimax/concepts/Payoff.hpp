#pragma once

#include "minimax/PayoffTraits.hpp"

#include <concepts>

namespace minimax {
namespace concepts {

// A totally ordered value with minimum and maximum sentinels.
template <typename P>
concept Payoff = std::totally_ordered<P> && std::copyable<P> && requires {
  { PayoffTraits<P>::min() } -> std::convertible_to<P>;
  { PayoffTraits<P>::max() } -> std::convertible_to<P>;
};

// A Payoff that additionally has an order-reversing involution, as required by negamax.
template <typename P>
concept NegatablePayoff = Payoff<P> && requires(const P& p) {
  { PayoffTraits<P>::negate(p) } -> std::convertible_to<P>;
};

}  // namespace concepts
}  // namespace minimax
