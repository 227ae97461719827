#pragma once

#include "minimax/PayoffTraits.hpp"
#include "minimax/concepts/Payoff.hpp"

#include <optional>
#include <ostream>

namespace minimax {

/*
 * The alpha-beta interval [lo, hi] of payoffs that can still influence the decision at the root.
 *
 * A window is valid iff lo <= hi. Narrowing never produces an invalid Window object; instead the
 * narrowing functions return std::nullopt, which is the engine's cutoff signal.
 */
template <concepts::Payoff Payoff>
class Window {
 public:
  using Traits = PayoffTraits<Payoff>;

  // Unchecked.
  Window(const Payoff& lo, const Payoff& hi) : lo_(lo), hi_(hi) {}

  // [min, max]
  static Window full() { return Window(Traits::min(), Traits::max()); }

  // Returns std::nullopt if hi < lo.
  static std::optional<Window> try_make(const Payoff& lo, const Payoff& hi);

  const Payoff& lo() const { return lo_; }
  const Payoff& hi() const { return hi_; }
  bool valid() const { return !(hi_ < lo_); }

  // Narrowing after a maximizing actor found v: lo becomes max(lo, v).
  std::optional<Window> raise_lo(const Payoff& v) const;

  // Narrowing after a minimizing actor found v: hi becomes min(hi, v).
  std::optional<Window> lower_hi(const Payoff& v) const;

  // [negate(hi), negate(lo)]: the same window seen from the opponent's side.
  Window negated() const
    requires concepts::NegatablePayoff<Payoff>;

  bool operator==(const Window& other) const = default;

 private:
  Payoff lo_;
  Payoff hi_;
};

template <concepts::Payoff Payoff>
std::ostream& operator<<(std::ostream& os, const Window<Payoff>& window)
  requires requires(std::ostream& s, const Payoff& p) { s << p; }
{
  return os << "[" << window.lo() << ", " << window.hi() << "]";
}

}  // namespace minimax

#include "inline/minimax/Window.inl"
