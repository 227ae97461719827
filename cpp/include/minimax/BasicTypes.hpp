#pragma once

#include <array>
#include <cstdint>
#include <string>

namespace minimax {

// Plies of lookahead. See SearchParams::search_depth for the exact meaning at the root.
using depth_t = int;

// One of the two players of a turn-based adversarial game.
enum class Actor : int8_t { kFirst, kSecond };

constexpr std::array<Actor, 2> kActors = {Actor::kFirst, Actor::kSecond};

// opponent() is an involution: opponent(opponent(a)) == a.
constexpr Actor opponent(Actor actor) {
  return actor == Actor::kFirst ? Actor::kSecond : Actor::kFirst;
}

// "First" / "Second"
std::string actor_to_str(Actor actor);

// Inverse of actor_to_str(), case-insensitive. Throws util::CleanException on unknown names.
Actor parse_actor(const std::string& str);

}  // namespace minimax

#include "inline/minimax/BasicTypes.inl"
