#include "checkers/perft.hpp"
#include "checkers/movegen.hpp"
#include "checkers/move_do.hpp"
#include <stdexcept>
#include <vector>

namespace checkers {

static std::uint64_t perft_mut(Board& b, int depth, const Rules& rules) {
  if (depth == 0) return 1ULL;

  MoveList ml;
  generate_legal(b, ml, rules);
  if (depth == 1) return ml.size();

  std::uint64_t nodes = 0ULL;
  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    nodes += perft_mut(b, depth - 1, rules);
    undo_move(b, m, st);
  }
  return nodes;
}

std::uint64_t perft(const Board& b, int depth, const Rules& rules) {
  if (depth < 0) throw std::invalid_argument("perft depth must be >= 0");
  Board copy = b;              // copy once at root
  return perft_mut(copy, depth, rules);
}

void perft_divide(const Board& b, int depth,
                  std::vector<std::pair<Move, std::uint64_t>>& out,
                  const Rules& rules) {
  out.clear();
  if (depth <= 0) return;

  Board root = b;
  MoveList ml;
  generate_legal(root, ml, rules);

  for (const auto& m : ml) {
    State st{};
    do_move(root, m, st);
    out.emplace_back(m, perft_mut(root, depth - 1, rules));
    undo_move(root, m, st);
  }
}

} // namespace checkers
