#include <cassert>
#include <iostream>

#include "checkers/board.hpp"
#include "checkers/game.hpp"
#include "checkers/search.hpp"

int main() {
  using namespace checkers;

  Board b = Board::initial();

  SearchLimits lim{};
  lim.depth = 2;       // deterministic and fast
  lim.nodes = 0;

  const int maxPlies = 30;

  GameResult g = selfplay(b, maxPlies, lim);

  // Must at least produce some moves and be internally consistent.
  assert(!g.moves.empty());
  assert(g.plies == static_cast<int>(g.moves.size()));
  assert(g.plies <= maxPlies);
  assert(!g.reason.empty());
  assert(g.nodes > 0);

  // Re-validate legality by replaying the game; apply() rejects illegal moves.
  Board r = Board::initial();
  for (const auto& m : g.moves) r = r.apply(m);

  // Same inputs, same game.
  GameResult again = selfplay(Board::initial(), maxPlies, lim);
  assert(again.plies == g.plies);
  for (std::size_t i = 0; i < g.moves.size(); ++i) assert(same_move(again.moves[i], g.moves[i]));

  // A side with nothing left has lost.
  Board done;
  done.set_piece(make_square(5, 2), man(Color::Red));
  done.set_side_to_move(Color::Black);
  GameResult over = selfplay(done, 10, lim);
  assert(over.outcome == GameOutcome::RedWin);
  assert(over.plies == 0);

  std::cout << "selfplay_smoke ok plies " << g.plies << "\n";
  return 0;
}
