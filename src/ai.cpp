#include "checkers/ai.hpp"
#include "checkers/errors.hpp"
#include "checkers/movegen.hpp"

#include <stdexcept>
#include <string>

namespace checkers {

static void require_to_move(const Board& b, Color player) {
  if (b.side_to_move() != player)
    throw InvalidStateError("search requested for the side not to move");
}

AI::AI(int depth) {
  if (depth < 1) throw std::invalid_argument("search depth must be positive, got " + std::to_string(depth));
  limits_.depth = depth;
}

AI::AI(const SearchLimits& limits) : limits_(limits) {
  if (limits_.depth < 0) throw std::invalid_argument("search depth must not be negative");
  if (limits_.depth == 0) limits_.depth = DEFAULT_DEPTH;
}

SearchResult AI::search(const Board& b, Color player) {
  require_to_move(b, player);
  SearchResult r = checkers::search(b, limits_);
  last_ = r.stats;
  if (r.best.is_null()) throw NoLegalMoveError("no legal move for the side to move");
  return r;
}

Move AI::get_best_move(const Board& b, Color player) {
  return search(b, player).best;
}

std::vector<ScoredMove> AI::evaluate_moves(const Board& b, Color player) const {
  require_to_move(b, player);
  return rank_moves(b, limits_);
}

} // namespace checkers
