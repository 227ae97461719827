#include "games/tictactoe/Game.hpp"

#include "util/Asserts.hpp"
#include "util/Exception.hpp"

#include <fmt/ostream.h>
#include <magic_enum/magic_enum.hpp>

#include <bit>
#include <cctype>

namespace tictactoe {

std::ostream& operator<<(std::ostream& os, const Placement& placement) {
  return os << (placement.actor() == kX ? 'X' : 'O') << placement.cell();
}

std::string evaluation_to_str(Evaluation evaluation) {
  return std::string(magic_enum::enum_name(evaluation).substr(1));
}

std::vector<Placement> Rules::legal_actions(const Board& board, minimax::Actor actor) {
  std::vector<Placement> actions;
  if (actor != board.actor_to_move() || is_terminal(board)) return actions;

  mask_t empty_mask = ~board.full_mask() & kFullBoardMask;
  while (empty_mask) {
    int cell = std::countr_zero(empty_mask);
    actions.emplace_back(cell, actor);
    empty_mask &= empty_mask - 1;
  }
  return actions;
}

Board Rules::apply(const Board& board, const Placement& placement) {
  RELEASE_ASSERT(is_legal(board, placement), "Illegal placement {} on board:\n{}",
                 fmt::streamed(placement), IO::compact_repr(board));

  Board next = board;
  mask_t piece_mask = mask_t(1) << placement.cell();
  if (placement.actor() == kX) {
    next.x_mask |= piece_mask;
  } else {
    next.o_mask |= piece_mask;
  }
  return next;
}

void IO::print_board(std::ostream& os, const Board& board) {
  char text[] =
    "0 1 2  | | | |\n"
    "3 4 5  | | | |\n"
    "6 7 8  | | | |\n";

  int offset_table[] = {8, 10, 12, 23, 25, 27, 38, 40, 42};
  for (int i = 0; i < kNumCells; ++i) {
    std::optional<minimax::Actor> actor = board.get_actor_at(i);
    if (actor) {
      text[offset_table[i]] = *actor == kX ? 'X' : 'O';
    }
  }

  os << text << std::endl;
}

std::string IO::compact_repr(const Board& board) {
  char buf[12];
  const char* syms = "XO";

  for (int row = 0; row < kBoardDimension; ++row) {
    for (int col = 0; col < kBoardDimension; ++col) {
      std::optional<minimax::Actor> actor = board.get_actor_at(row * kBoardDimension + col);
      buf[row * 4 + col] = actor ? syms[static_cast<int>(*actor)] : '_';
    }
  }
  buf[3] = '\n';
  buf[7] = '\n';
  buf[11] = '\0';

  return std::string(buf);
}

Board IO::load_board(const std::string& str) {
  Board board;
  int cell = 0;
  for (char c : str) {
    if (c == '\n') continue;
    CLEAN_ASSERT(cell < kNumCells, "Too many cells in board \"{}\"", str);
    mask_t piece_mask = mask_t(1) << cell;
    switch (c) {
      case 'X':
        board.x_mask |= piece_mask;
        break;
      case 'O':
        board.o_mask |= piece_mask;
        break;
      case '_':
        break;
      default:
        throw util::CleanException("Unexpected character '{}' in board \"{}\"", c, str);
    }
    ++cell;
  }

  CLEAN_ASSERT(cell == kNumCells, "Too few cells in board \"{}\"", str);

  int num_x = std::popcount(board.x_mask);
  int num_o = std::popcount(board.o_mask);
  CLEAN_ASSERT(num_x == num_o || num_x == num_o + 1, "Unreachable board \"{}\" ({} X, {} O)", str,
               num_x, num_o);

  // The game stops at the first three in a row, so the winner made the last move.
  bool x_won = board.has_three_in_a_row(kX);
  bool o_won = board.has_three_in_a_row(kO);
  CLEAN_ASSERT(!(x_won && o_won), "Unreachable board \"{}\" (both sides won)", str);
  CLEAN_ASSERT(!x_won || num_x == num_o + 1, "Unreachable board \"{}\" (O moved after X won)",
               str);
  CLEAN_ASSERT(!o_won || num_x == num_o, "Unreachable board \"{}\" (X moved after O won)", str);
  return board;
}

std::optional<int> IO::parse_cell(const std::string& str) {
  if (str.size() != 1 || !std::isdigit(static_cast<unsigned char>(str[0]))) return std::nullopt;
  int cell = str[0] - '0';
  if (cell >= kNumCells) return std::nullopt;
  return cell;
}

}  // namespace tictactoe
