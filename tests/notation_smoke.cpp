#include <cassert>
#include <string>
#include "checkers/board.hpp"
#include "checkers/errors.hpp"
#include "checkers/notation.hpp"
#include "checkers/types.hpp"

using namespace checkers;

int main() {
  // Numbering: 1..32 left to right from Black's back row
  {
    assert(square_number(make_square(0, 1)) == 1);
    assert(square_number(make_square(0, 7)) == 4);
    assert(square_number(make_square(1, 0)) == 5);
    assert(square_number(make_square(7, 6)) == 32);
    for (int n = 1; n <= 32; ++n) {
      const Square s = square_from_number(n);
      assert(is_playable(s));
      assert(square_number(s) == n);
    }
  }

  // Quiet moves round-trip on startpos
  {
    Board b = Board::initial();
    Move m = parse_move(b, "21-17");
    assert(m.from == make_square(5, 0) && m.to() == make_square(4, 1));
    assert(move_to_string(m) == "21-17");

    for (const auto& cand : b.legal_moves(Color::Red))
      assert(same_move(parse_move(b, move_to_string(cand)), cand));
  }

  // Capture chains, full and shortened
  {
    Board b;
    b.set_piece(make_square(6, 3), man(Color::Red));
    b.set_piece(make_square(5, 2), man(Color::Black));
    b.set_piece(make_square(5, 4), man(Color::Black));
    b.set_piece(make_square(3, 4), man(Color::Black));
    b.set_piece(make_square(3, 6), man(Color::Black));

    Move m = parse_move(b, "26x19x10");
    assert(m.cap_len == 2 && m.to() == make_square(2, 3));
    assert(move_to_string(m) == "26x19x10");

    Move s = parse_move(b, "26x12");
    assert(s.cap_len == 2 && s.to() == make_square(2, 7));
    assert(move_to_string(s) == "26x19x12");

    assert(move_to_string(parse_move(b, "26x17")) == "26x17");
  }

  // Rejected text
  {
    Board b = Board::initial();
    const char* bad[] = {"21-18", "9-13", "21x17", "21", "21-", "a1-b2", "21-17x14", "33-29"};
    for (const char* t : bad) {
      bool threw = false;
      try { (void)parse_move(b, t); } catch (const InvalidMoveError&) { threw = true; }
      assert(threw);
    }
  }

  return 0;
}
