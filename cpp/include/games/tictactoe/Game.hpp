#pragma once

#include "games/tictactoe/Constants.hpp"
#include "minimax/BasicTypes.hpp"
#include "minimax/PayoffTraits.hpp"
#include "minimax/concepts/Evaluator.hpp"
#include "minimax/concepts/Rule.hpp"

#include <compare>
#include <optional>
#include <ostream>
#include <string>
#include <vector>

namespace tictactoe {

constexpr mask_t make_mask(int a, int b, int c) {
  return (mask_t(1) << a) + (mask_t(1) << b) + (mask_t(1) << c);
}

constexpr mask_t kThreeInARowMasks[] = {
  make_mask(0, 1, 2), make_mask(3, 4, 5), make_mask(6, 7, 8), make_mask(0, 3, 6),
  make_mask(1, 4, 7), make_mask(2, 5, 8), make_mask(0, 4, 8), make_mask(2, 4, 6)};

/*
 * Bit order encoding for the board:
 *
 * 0 1 2
 * 3 4 5
 * 6 7 8
 *
 * X (the first actor) always moves first, so the actor to move is determined by the number of
 * pieces on the board.
 */
struct Board {
  auto operator<=>(const Board& other) const = default;

  mask_t full_mask() const { return x_mask | o_mask; }
  mask_t mask(minimax::Actor actor) const { return actor == kX ? x_mask : o_mask; }
  int num_pieces() const;
  minimax::Actor actor_to_move() const;
  std::optional<minimax::Actor> get_actor_at(int cell) const;

  bool has_three_in_a_row(minimax::Actor actor) const;

  // The actor with three in a row, if any.
  std::optional<minimax::Actor> winner() const;

  mask_t x_mask = 0;
  mask_t o_mask = 0;
};

class Placement {
 public:
  Placement(int cell, minimax::Actor actor) : cell_(cell), actor_(actor) {}

  bool operator==(const Placement& other) const = default;

  int cell() const { return cell_; }
  minimax::Actor actor() const { return actor_; }

 private:
  int cell_;
  minimax::Actor actor_;
};

// "X4", "O0", etc.
std::ostream& operator<<(std::ostream& os, const Placement& placement);

struct Rules {
  using Position = Board;
  using Action = Placement;

  // Three in a row, or a full board.
  static bool is_terminal(const Board& board);

  // The empty cells, in cell order. Empty if the game is over or if it is not actor's turn.
  static std::vector<Placement> legal_actions(const Board& board, minimax::Actor actor);

  // Throws util::ReleaseAssertionError if placement is illegal.
  static Board apply(const Board& board, const Placement& placement);

  static bool is_legal(const Board& board, const Placement& placement);
};

// Qualitative payoff scale used by OrdinalEvaluator.
enum class Evaluation : int8_t { kLose, kOpponentHoldsCenter, kEven, kHoldsCenter, kWin };

std::string evaluation_to_str(Evaluation evaluation);

inline std::ostream& operator<<(std::ostream& os, Evaluation evaluation) {
  return os << evaluation_to_str(evaluation);
}

/*
 * Scores won and lost games as kWin and kLose, and draws as kEven. Otherwise, the board is judged by
 * who holds the center cell.
 */
struct OrdinalEvaluator {
  using Payoff = Evaluation;

  static Evaluation score_for(minimax::Actor actor, const Board& board);
};

/*
 * Integer variant of OrdinalEvaluator: +/-kWinScore for won/lost games, 0 for draws, and
 * +/-kCenterScore for holding the center of an unfinished game.
 */
struct ScoreEvaluator {
  using Payoff = int;

  static int score_for(minimax::Actor actor, const Board& board);
};

struct IO {
  /*
   * Prints the board next to a legend of cell indices:
   *
   * 0 1 2  |X| | |
   * 3 4 5  | |O| |
   * 6 7 8  | | | |
   */
  static void print_board(std::ostream& os, const Board& board);

  // Three lines of three characters from {X, O, _}, separated by newlines.
  static std::string compact_repr(const Board& board);

  /*
   * Inverse of compact_repr(). Newlines are optional. Throws util::CleanException if str does not
   * describe a reachable board.
   */
  static Board load_board(const std::string& str);

  // Parses a cell index in [0, kNumCells). Returns std::nullopt on malformed input.
  static std::optional<int> parse_cell(const std::string& str);
};

}  // namespace tictactoe

namespace minimax {

template <>
struct PayoffTraits<tictactoe::Evaluation> {
  using Evaluation = tictactoe::Evaluation;

  static constexpr Evaluation min() { return Evaluation::kLose; }
  static constexpr Evaluation max() { return Evaluation::kWin; }
  static constexpr Evaluation negate(Evaluation evaluation) {
    switch (evaluation) {
      case Evaluation::kLose:
        return Evaluation::kWin;
      case Evaluation::kOpponentHoldsCenter:
        return Evaluation::kHoldsCenter;
      case Evaluation::kEven:
        return Evaluation::kEven;
      case Evaluation::kHoldsCenter:
        return Evaluation::kOpponentHoldsCenter;
      case Evaluation::kWin:
        return Evaluation::kLose;
    }
    return evaluation;
  }
};

}  // namespace minimax

static_assert(minimax::concepts::Rule<tictactoe::Rules>);
static_assert(minimax::concepts::ZeroSumEvaluator<tictactoe::OrdinalEvaluator, tictactoe::Board>);
static_assert(minimax::concepts::ZeroSumEvaluator<tictactoe::ScoreEvaluator, tictactoe::Board>);

#include "inline/games/tictactoe/Game.inl"
