#include <cassert>
#include <iostream>
#include <vector>

#include "checkers/board.hpp"
#include "checkers/draw.hpp"
#include "checkers/fen.hpp"
#include "checkers/game.hpp"
#include "checkers/notation.hpp"

int main() {
  using namespace checkers;

  // 1) Move limit: 80 reversible plies => draw, even with a material edge
  {
    Board b;
    set_from_fen(b, "1b6/8/8/4R3/8/2R5/8/8 r 80");
    assert(is_move_limit_draw(b));
    std::vector<U64> hist = {b.hash()};
    GameState gs = game_state(b, hist);
    assert(gs.kind == GameState::Kind::Drawn);

    b.set_reversible_plies(79);
    assert(!is_move_limit_draw(b));
    assert(game_state(b, hist).kind == GameState::Kind::Ongoing);
  }

  // 2) Threefold repetition utility: synthetic history
  {
    std::vector<U64> hist = {1, 2, 1, 2, 1};
    assert(is_threefold_repetition(hist));

    std::vector<U64> hist2 = {5, 6, 5, 6};
    assert(!is_threefold_repetition(hist2));
  }

  // 3) Kings shuffling back and forth repeat the position
  {
    Board b;
    set_from_fen(b, "1R6/8/8/8/8/8/8/6B1 r 0");
    std::vector<U64> hist = {b.hash()};
    const char* shuffle[] = {"1-5", "32-28", "5-1", "28-32", "1-5", "32-28", "5-1", "28-32"};
    for (const char* t : shuffle) {
      assert(!is_threefold_repetition(hist));
      b = b.apply(parse_move(b, t));
      hist.push_back(b.hash());
    }
    assert(is_threefold_repetition(hist));
    assert(b.reversible_plies() == 8);
    assert(game_state(b, hist).kind == GameState::Kind::Drawn);
  }

  // 4) Win is reported for the side that still moves
  {
    Board b;
    set_from_fen(b, "8/8/8/8/8/8/1b6/r1r5 b 0");
    GameState gs = game_state(b);
    assert(gs.kind == GameState::Kind::Won);
    assert(gs.winner == Color::Red);
  }

  std::cout << "draw_rules_smoke ok\n";
  return 0;
}
