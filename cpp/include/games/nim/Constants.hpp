#pragma once

namespace nim {

const int kMaxStonesToTake = 3;
const int kStartingStones = 21;

// Evaluator payoff of a won game. Unfinished games score 0.
const int kWinScore = 1;

}  // namespace nim
