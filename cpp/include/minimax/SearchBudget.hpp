#pragma once

#include <atomic>
#include <chrono>
#include <cstdint>

namespace minimax {

/*
 * Cooperative cancellation flag. A search polls it once per node visit, so cancel() may be called
 * from any thread while a search is running.
 */
class CancellationToken {
 public:
  void cancel() { cancelled_.store(true, std::memory_order_relaxed); }
  void reset() { cancelled_.store(false, std::memory_order_relaxed); }
  bool cancelled() const { return cancelled_.load(std::memory_order_relaxed); }

 private:
  std::atomic<bool> cancelled_ = false;
};

/*
 * Decides, once per node visit, whether a search must stop. It trips on the first of:
 *
 * - the cancellation token being set,
 * - the wall-clock deadline passing (time_limit_ms > 0),
 * - node_limit nodes having been visited already (node_limit > 0).
 *
 * Once tripped it stays tripped.
 */
class SearchBudget {
 public:
  using clock_t = std::chrono::steady_clock;

  SearchBudget(clock_t::time_point start, int64_t time_limit_ms, int64_t node_limit,
               const CancellationToken* token);

  bool exhausted(int64_t nodes_visited);
  bool tripped() const { return tripped_; }

 private:
  const clock_t::time_point deadline_;
  const int64_t node_limit_;
  const CancellationToken* const token_;
  const bool has_deadline_;
  bool tripped_ = false;
};

}  // namespace minimax

#include "inline/minimax/SearchBudget.inl"
