#pragma once

#include <atomic>
#include <cstdint>
#include <vector>

#include "checkers/board.hpp"
#include "checkers/eval.hpp"
#include "checkers/movegen.hpp"
#include "checkers/rules.hpp"

namespace checkers {

// Score for a side with no legal move at ply 0; a loss found deeper scores
// -(WIN_SCORE - ply) so quicker wins rank higher. Far outside any evaluation.
constexpr int WIN_SCORE = 1'000'000;

struct SearchStats {
  std::uint64_t nodes{0};
  std::uint64_t cutoffs{0};  // alpha >= beta events
  int max_depth{0};          // deepest ply entered
};

struct SearchResult {
  Move best{};
  int score{0};              // POV = side to move
  int depth{0};              // last fully completed iteration
  std::vector<Move> pv;      // principal variation, best line
  SearchStats stats{};
  bool aborted{false};       // a budget ran out before `depth` reached the request
};

// Search configuration. Budgets are checked on node entry only, and an
// interrupted iteration is discarded in favour of the last completed one.
struct SearchLimits {
  int depth = 0;                    // 0 => engine default
  std::uint64_t nodes = 0;          // 0 => unlimited
  int movetime_ms = 0;              // 0 => unlimited
  std::atomic<bool>* stop = nullptr;
  bool alpha_beta = true;           // false => plain minimax (reference)
  EvalWeights weights{};
  Rules rules{};
};

struct ScoredMove {
  Move move{};
  int score{0};
};

constexpr int DEFAULT_DEPTH = 4;

SearchResult search(const Board& root, int maxDepth);
SearchResult search(const Board& root, const SearchLimits& lim);

// Captures first, longer chains before shorter; otherwise generation order.
void order_moves(MoveList& ml);

// Every root move with its full-window score at depth - 1 below it, best
// first (ties keep search order).
std::vector<ScoredMove> rank_moves(const Board& root, const SearchLimits& lim);

} // namespace checkers
