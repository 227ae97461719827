#include "minimax/SearchParams.hpp"

#include "util/Asserts.hpp"
#include "util/BoostUtil.hpp"
#include "util/Exception.hpp"

#include <boost/program_options.hpp>
#include <magic_enum/magic_enum.hpp>

namespace minimax {

inline std::string variant_to_str(Variant variant) {
  // enumerator names carry the "k" prefix
  return std::string(magic_enum::enum_name(variant).substr(1));
}

inline Variant parse_variant(const std::string& str) {
  auto variant = magic_enum::enum_cast<Variant>("k" + str, magic_enum::case_insensitive);
  if (!variant.has_value()) {
    throw util::CleanException("Unknown search variant: \"{}\" (expected AlphaBeta or Negamax)",
                               str);
  }
  return *variant;
}

inline void validate(boost::any& v, const std::vector<std::string>& values, Variant*, int) {
  namespace po = boost::program_options;
  po::validators::check_first_occurrence(v);
  const std::string& s = po::validators::get_single_string(values);
  try {
    v = boost::any(parse_variant(s));
  } catch (const util::CleanException&) {
    throw po::validation_error(po::validation_error::invalid_option_value);
  }
}

inline auto SearchParams::make_options_description() {
  namespace po = boost::program_options;
  namespace po2 = boost_util::program_options;

  po2::options_description desc("Search options");

  return desc
    .template add_option<"search-depth", 'd'>(
      po::value<depth_t>(&search_depth)->default_value(search_depth),
      "plies searched below each candidate move (0 = greedy one-ply choice)")
    .template add_option<"variant", 'v'>(
      po::value<Variant>(&variant)->default_value(variant, variant_to_str(variant)),
      "search variant (AlphaBeta or Negamax)")
    .template add_flag<"enable-pruning", "disable-pruning">(
      &enable_pruning, "enable alpha-beta cutoffs", "disable alpha-beta cutoffs (full-width search)")
    .template add_option<"time-limit-ms">(
      po::value<int64_t>(&time_limit_ms)->default_value(time_limit_ms),
      "wall-clock budget per search in milliseconds (0 = unlimited)")
    .template add_hidden_option<"node-limit">(
      po::value<int64_t>(&node_limit)->default_value(node_limit),
      "node budget per search (0 = unlimited)")
    .template add_flag<"verbose-search", "quiet-search">(
      &verbose, "log every search at info level, with its principal variation",
      "log search summaries at debug level");
}

inline void SearchParams::validate() const {
  CLEAN_ASSERT(search_depth >= 0, "--search-depth must be non-negative (got {})", search_depth);
  CLEAN_ASSERT(search_depth <= kMaxSearchDepth, "--search-depth must be at most {} (got {})",
               kMaxSearchDepth, search_depth);
  CLEAN_ASSERT(time_limit_ms >= 0, "--time-limit-ms must be non-negative (got {})",
               time_limit_ms);
  CLEAN_ASSERT(node_limit >= 0, "--node-limit must be non-negative (got {})", node_limit);
}

}  // namespace minimax
