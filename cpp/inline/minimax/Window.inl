#include "minimax/Window.hpp"

namespace minimax {

template <concepts::Payoff Payoff>
std::optional<Window<Payoff>> Window<Payoff>::try_make(const Payoff& lo, const Payoff& hi) {
  if (hi < lo) return std::nullopt;
  return Window(lo, hi);
}

template <concepts::Payoff Payoff>
std::optional<Window<Payoff>> Window<Payoff>::raise_lo(const Payoff& v) const {
  return try_make(lo_ < v ? v : lo_, hi_);
}

template <concepts::Payoff Payoff>
std::optional<Window<Payoff>> Window<Payoff>::lower_hi(const Payoff& v) const {
  return try_make(lo_, v < hi_ ? v : hi_);
}

template <concepts::Payoff Payoff>
Window<Payoff> Window<Payoff>::negated() const
  requires concepts::NegatablePayoff<Payoff>
{
  return Window(Traits::negate(hi_), Traits::negate(lo_));
}

}  // namespace minimax
