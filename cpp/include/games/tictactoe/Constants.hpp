#pragma once

#include "minimax/BasicTypes.hpp"

#include <cstdint>

namespace tictactoe {

using mask_t = uint16_t;
const int kBoardDimension = 3;
const int kNumCells = kBoardDimension * kBoardDimension;
const int kCenterCell = 4;
const mask_t kFullBoardMask = (mask_t(1) << kNumCells) - 1;

const minimax::Actor kX = minimax::Actor::kFirst;
const minimax::Actor kO = minimax::Actor::kSecond;

// ScoreEvaluator payoffs
const int kWinScore = 100;
const int kCenterScore = 1;

}  // namespace tictactoe
