#include <cassert>
#include <iostream>
#include <stdexcept>
#include "checkers/ai.hpp"
#include "checkers/board.hpp"
#include "checkers/errors.hpp"
#include "checkers/movegen.hpp"
#include "checkers/search.hpp"

using namespace checkers;

static bool move_is_legal(const Board& b, const Move& m) {
  MoveList ml;
  generate_legal(b, ml);
  for (const auto& cand : ml) if (same_move(cand, m)) return true;
  return false;
}

int main() {
  // STARTPOS depth-1: a single step for either side, with a PV
  {
    Board b = Board::initial();
    AI ai(1);
    Move m = ai.get_best_move(b, Color::Red);
    assert(move_is_legal(b, m));
    assert(m.path_len == 1 && !m.is_capture());
    assert(ai.last_stats().nodes > 0);

    b.set_side_to_move(Color::Black);
    m = ai.get_best_move(b, Color::Black);
    assert(move_is_legal(b, m));
    assert(m.path_len == 1);
  }

  // Deeper search from the start returns a legal move and a full-length PV
  {
    Board b = Board::initial();
    SearchResult r = search(b, 4);
    assert(move_is_legal(b, r.best));
    assert(r.depth == 4);
    assert(r.pv.size() == 4);
    assert(same_move(r.pv.front(), r.best));
    assert(r.stats.max_depth == 4);
    assert(!r.aborted);
  }

  // Only one legal move, and it is a capture: chosen at every depth
  {
    Board b;
    b.set_piece(make_square(5, 2), man(Color::Red));
    b.set_piece(make_square(4, 3), man(Color::Black));
    b.set_piece(make_square(7, 6), man(Color::Red));
    b.set_piece(make_square(0, 1), man(Color::Black));
    MoveList ml = b.legal_moves(Color::Red);
    assert(ml.size() == 1);
    for (int d = 1; d <= 6; ++d) {
      AI ai(d);
      assert(same_move(ai.get_best_move(b, Color::Red), ml[0]));
    }
  }

  // Winning capture of the last enemy piece scores as a win one ply away
  {
    Board b;
    b.set_piece(make_square(5, 2), man(Color::Red));
    b.set_piece(make_square(4, 3), man(Color::Black));
    SearchResult r = search(b, 3);
    assert(r.score == WIN_SCORE - 1);
    assert(r.best.is_capture());
  }

  // Terminal positions: no pieces, or pieces with no move
  {
    Board b;
    b.set_piece(make_square(5, 2), man(Color::Red));
    b.set_side_to_move(Color::Black);
    assert(b.is_terminal());

    AI ai(3);
    bool threw = false;
    try { (void)ai.get_best_move(b, Color::Black); } catch (const NoLegalMoveError&) { threw = true; }
    assert(threw);

    SearchResult r = search(b, 3);
    assert(r.best.is_null());
    assert(r.score == -WIN_SCORE);

    Board blocked;
    blocked.set_piece(make_square(6, 1), man(Color::Black));
    blocked.set_piece(make_square(7, 0), man(Color::Red));
    blocked.set_piece(make_square(7, 2), man(Color::Red));
    blocked.set_side_to_move(Color::Black);
    assert(blocked.is_terminal());
    assert(blocked.count(Color::Black) == 1);
  }

  // Configuration and caller errors
  {
    bool threw = false;
    try { AI bad(0); (void)bad; } catch (const std::invalid_argument&) { threw = true; }
    assert(threw);

    AI ai(2);
    threw = false;
    try { (void)ai.get_best_move(Board::initial(), Color::Black); } catch (const InvalidStateError&) { threw = true; }
    assert(threw);
  }

  // Ranked root moves: every legal move once, best first, top equals the search
  {
    Board b = Board::initial();
    AI ai(3);
    auto ranked = ai.evaluate_moves(b, Color::Red);
    assert(ranked.size() == 7);
    for (std::size_t i = 1; i < ranked.size(); ++i) assert(ranked[i - 1].score >= ranked[i].score);
    SearchResult r = ai.search(b, Color::Red);
    assert(ranked.front().score == r.score);
    assert(same_move(ranked.front().move, r.best));
  }

  std::cout << "search_smoke ok\n";
  return 0;
}
