#pragma once

#include <cstdint>
#include <ostream>
#include <string>

namespace minimax {

// Counters collected by one search. Aggregate across searches with +=.
struct SearchStats {
  SearchStats& operator+=(const SearchStats& other);
  std::string to_str() const;

  int64_t nodes_visited = 0;
  int64_t leaves_evaluated = 0;
  int64_t cutoffs = 0;
  int64_t no_decision_nodes = 0;
  int64_t elapsed_ns = 0;
};

inline std::ostream& operator<<(std::ostream& os, const SearchStats& stats) {
  return os << stats.to_str();
}

}  // namespace minimax

#include "inline/minimax/SearchStats.inl"
