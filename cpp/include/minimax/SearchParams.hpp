#pragma once

#include "minimax/BasicTypes.hpp"

#include <boost/any.hpp>

#include <cstdint>
#include <string>
#include <vector>

namespace minimax {

// Which engine implements a strategy.
enum Variant : int8_t {
  kAlphaBeta,  // minimax with alpha-beta pruning, single retained best line
  kNegamax     // negamax with alpha-beta pruning, full retained tree
};

// "AlphaBeta" / "Negamax"
std::string variant_to_str(Variant variant);

// Inverse of variant_to_str(), case-insensitive. Throws util::CleanException on unknown names.
Variant parse_variant(const std::string& str);

struct SearchParams {
  static constexpr depth_t kMaxSearchDepth = 1000;

  auto make_options_description();

  // Throws util::CleanException on negative values, or on a depth above kMaxSearchDepth.
  void validate() const;

  /*
   * Plies searched below each candidate move of the root. With search_depth = 0, each legal
   * action is scored by the evaluator right after it is applied, i.e., a greedy one-ply choice.
   */
  depth_t search_depth = 4;

  Variant variant = kAlphaBeta;

  // With pruning disabled, the engine performs full-width minimax.
  bool enable_pruning = true;

  // 0 means unlimited.
  int64_t time_limit_ms = 0;
  int64_t node_limit = 0;

  // Log each search at info level, with its principal variation and root-child payoffs.
  bool verbose = false;
};

// Lets boost::program_options parse --variant values.
void validate(boost::any& v, const std::vector<std::string>& values, Variant*, int);

}  // namespace minimax

#include "inline/minimax/SearchParams.inl"
