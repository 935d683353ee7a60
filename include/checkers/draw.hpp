#pragma once

#include <vector>

#include "checkers/board.hpp"
#include "checkers/types.hpp"

namespace checkers {

// 40 moves each without a capture or a man move.
constexpr int MOVE_LIMIT_PLIES = 80;

inline bool is_move_limit_draw(const Board& b) {
  return b.reversible_plies() >= MOVE_LIMIT_PLIES;
}

// Threefold repetition: history.back() is the current position key.
// Return true if this key occurs at least 3 times in the history stack.
inline bool is_threefold_repetition(const std::vector<U64>& history) {
  if (history.empty()) return false;
  const U64 key = history.back();
  int count = 0;
  for (U64 k : history) {
    if (k == key) ++count;
  }
  return count >= 3;
}

inline bool is_rule_draw(const Board& b, const std::vector<U64>& history) {
  return is_move_limit_draw(b) || is_threefold_repetition(history);
}

} // namespace checkers
