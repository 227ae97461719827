#pragma once

#include <concepts>
#include <limits>

namespace minimax {

/*
 * PayoffTraits<P> supplies the sentinels of a payoff type, and, for payoff types usable with the
 * negamax variant, its additive inverse.
 *
 * Specializations must provide:
 *
 *   static P min();  // no reachable payoff compares below min()
 *   static P max();  // no reachable payoff compares above max()
 *
 * and, for the negamax variant:
 *
 *   static P negate(const P&);  // negate(negate(x)) == x, and x < y iff negate(y) < negate(x)
 *
 * Arithmetic types are covered below. Qualitative scales (enums) specialize this template next to
 * their definition, supplying an explicit order-reversing map as negate().
 */
template <typename P>
struct PayoffTraits;

/*
 * min() is -max() rather than numeric_limits::min(): the latter has no representable negation in
 * two's complement, and negamax negates every bound it passes down.
 */
template <std::signed_integral P>
struct PayoffTraits<P> {
  static constexpr P min() { return -std::numeric_limits<P>::max(); }
  static constexpr P max() { return std::numeric_limits<P>::max(); }
  static constexpr P negate(const P& p) { return -p; }
};

// No negate(): usable with the alpha-beta variant only.
template <std::unsigned_integral P>
struct PayoffTraits<P> {
  static constexpr P min() { return 0; }
  static constexpr P max() { return std::numeric_limits<P>::max(); }
};

template <std::floating_point P>
struct PayoffTraits<P> {
  static constexpr P min() { return -std::numeric_limits<P>::infinity(); }
  static constexpr P max() { return std::numeric_limits<P>::infinity(); }
  static constexpr P negate(const P& p) { return -p; }
};

}  // namespace minimax
