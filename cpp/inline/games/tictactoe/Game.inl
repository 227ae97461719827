#include "games/tictactoe/Game.hpp"

#include <bit>

namespace tictactoe {

inline int Board::num_pieces() const { return std::popcount(full_mask()); }

inline minimax::Actor Board::actor_to_move() const { return num_pieces() % 2 == 0 ? kX : kO; }

inline std::optional<minimax::Actor> Board::get_actor_at(int cell) const {
  mask_t piece_mask = mask_t(1) << cell;
  if (x_mask & piece_mask) return kX;
  if (o_mask & piece_mask) return kO;
  return std::nullopt;
}

inline bool Board::has_three_in_a_row(minimax::Actor actor) const {
  mask_t actor_mask = mask(actor);
  for (mask_t line : kThreeInARowMasks) {
    if ((line & actor_mask) == line) return true;
  }
  return false;
}

inline std::optional<minimax::Actor> Board::winner() const {
  for (minimax::Actor actor : minimax::kActors) {
    if (has_three_in_a_row(actor)) return actor;
  }
  return std::nullopt;
}

inline bool Rules::is_terminal(const Board& board) {
  return board.full_mask() == kFullBoardMask || board.winner().has_value();
}

inline bool Rules::is_legal(const Board& board, const Placement& placement) {
  int cell = placement.cell();
  if (cell < 0 || cell >= kNumCells) return false;
  if (placement.actor() != board.actor_to_move()) return false;
  if (board.full_mask() & (mask_t(1) << cell)) return false;
  return !is_terminal(board);
}

inline Evaluation OrdinalEvaluator::score_for(minimax::Actor actor, const Board& board) {
  std::optional<minimax::Actor> winner = board.winner();
  if (winner) {
    return *winner == actor ? Evaluation::kWin : Evaluation::kLose;
  }
  if (board.full_mask() == kFullBoardMask) return Evaluation::kEven;  // draw

  std::optional<minimax::Actor> center = board.get_actor_at(kCenterCell);
  if (!center) return Evaluation::kEven;
  return *center == actor ? Evaluation::kHoldsCenter : Evaluation::kOpponentHoldsCenter;
}

inline int ScoreEvaluator::score_for(minimax::Actor actor, const Board& board) {
  std::optional<minimax::Actor> winner = board.winner();
  if (winner) {
    return *winner == actor ? kWinScore : -kWinScore;
  }
  if (board.full_mask() == kFullBoardMask) return 0;  // draw

  std::optional<minimax::Actor> center = board.get_actor_at(kCenterCell);
  if (!center) return 0;
  return *center == actor ? kCenterScore : -kCenterScore;
}

}  // namespace tictactoe
