#include "minimax/BasicTypes.hpp"

#include "util/Exception.hpp"

#include <magic_enum/magic_enum.hpp>

namespace minimax {

inline std::string actor_to_str(Actor actor) {
  // enumerator names carry the "k" prefix
  return std::string(magic_enum::enum_name(actor).substr(1));
}

inline Actor parse_actor(const std::string& str) {
  auto actor = magic_enum::enum_cast<Actor>("k" + str, magic_enum::case_insensitive);
  if (!actor.has_value()) {
    throw util::CleanException("Unknown actor: \"{}\" (expected First or Second)", str);
  }
  return *actor;
}

}  // namespace minimax
