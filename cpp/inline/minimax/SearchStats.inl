#include "minimax/SearchStats.hpp"

#include <fmt/format.h>

namespace minimax {

inline SearchStats& SearchStats::operator+=(const SearchStats& other) {
  nodes_visited += other.nodes_visited;
  leaves_evaluated += other.leaves_evaluated;
  cutoffs += other.cutoffs;
  no_decision_nodes += other.no_decision_nodes;
  elapsed_ns += other.elapsed_ns;
  return *this;
}

inline std::string SearchStats::to_str() const {
  return fmt::format("nodes={} leaves={} cutoffs={} no-decision={} time={:.3f}ms", nodes_visited,
                     leaves_evaluated, cutoffs, no_decision_nodes, elapsed_ns * 1e-6);
}

}  // namespace minimax
