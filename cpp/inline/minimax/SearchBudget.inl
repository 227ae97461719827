#include "minimax/SearchBudget.hpp"

namespace minimax {

inline SearchBudget::SearchBudget(clock_t::time_point start, int64_t time_limit_ms,
                                  int64_t node_limit, const CancellationToken* token)
    : deadline_(start + std::chrono::milliseconds(time_limit_ms)),
      node_limit_(node_limit),
      token_(token),
      has_deadline_(time_limit_ms > 0) {}

inline bool SearchBudget::exhausted(int64_t nodes_visited) {
  if (tripped_) return true;
  if (token_ && token_->cancelled()) {
    tripped_ = true;
  } else if (node_limit_ > 0 && nodes_visited >= node_limit_) {
    tripped_ = true;
  } else if (has_deadline_ && clock_t::now() >= deadline_) {
    tripped_ = true;
  }
  return tripped_;
}

}  // namespace minimax
