#pragma once

#include <vector>

#include "checkers/board.hpp"
#include "checkers/search.hpp"

namespace checkers {

// Move picker for one side. Each call runs an independent search; the only
// state kept between calls is the statistics of the most recent one.
class AI {
public:
  // Throws std::invalid_argument for depth < 1.
  explicit AI(int depth);
  explicit AI(const SearchLimits& limits);

  // Throws InvalidStateError if `player` is not to move and
  // NoLegalMoveError if the position is terminal for `player`.
  Move get_best_move(const Board& b, Color player);
  SearchResult search(const Board& b, Color player);

  // All legal moves for `player`, best first.
  std::vector<ScoredMove> evaluate_moves(const Board& b, Color player) const;

  const SearchStats& last_stats() const { return last_; }
  const SearchLimits& limits() const { return limits_; }
  int depth() const { return limits_.depth; }

private:
  SearchLimits limits_;
  SearchStats last_{};
};

} // namespace checkers
