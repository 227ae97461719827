#pragma once

#include <optional>
#include <utility>

namespace minimax {

/*
 * Holds either a read-only borrow of a caller's position or an owned position.
 *
 * The search root borrows the caller's position for the duration of the search, so it is never
 * copied. Every descendant owns the fresh value produced by the rule's apply(); no two nodes alias
 * the same position.
 */
template <typename Position>
class PositionHolder {
 public:
  static PositionHolder borrow(const Position& position) { return PositionHolder(&position); }
  static PositionHolder own(Position&& position) { return PositionHolder(std::move(position)); }

  const Position& get() const { return owned_ ? *owned_ : *borrowed_; }
  bool is_borrowed() const { return !owned_.has_value(); }

 private:
  explicit PositionHolder(const Position* borrowed) : borrowed_(borrowed) {}
  explicit PositionHolder(Position&& owned) : owned_(std::move(owned)) {}

  const Position* borrowed_ = nullptr;
  std::optional<Position> owned_;
};

}  // namespace minimax
