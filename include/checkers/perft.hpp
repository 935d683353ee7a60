#pragma once
#include <cstdint>
#include <utility>
#include <vector>
#include "checkers/types.hpp"
#include "checkers/board.hpp"
#include "checkers/movegen.hpp"

namespace checkers {

// Throws std::invalid_argument for depth < 0.
std::uint64_t perft(const Board& b, int depth, const Rules& rules = {});

// Per-move breakdown at root
void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out,
                  const Rules& rules = {});

} // namespace checkers
