#include <cassert>
#include <string>
#include "checkers/board.hpp"
#include "checkers/fen.hpp"


int main() {
using namespace checkers;


// Round-trip startpos
Board b1;
set_from_fen(b1, STARTPOS_FEN);
assert(to_fen(b1) == STARTPOS_FEN);
assert(b1.hash() == Board::initial().hash());


// Kings, black to move, nonzero clock
Board b2;
set_from_fen(b2, "8/8/3B4/8/8/2R5/8/8 b 12");
assert(to_fen(b2) == "8/8/3B4/8/8/2R5/8/8 b 12");
assert(b2.piece_at(make_square(2, 3))->king);
assert(b2.reversible_plies() == 12);


// A man written on its crown row comes back as a king
Board b3;
set_from_fen(b3, "1r6/8/8/8/8/8/8/b7 r");
assert(to_fen(b3) == "1R6/8/8/8/8/8/8/B7 r 0");


// Malformed input
bool threw = false;
try { Board x; set_from_fen(x, "8/8/8 r 0"); } catch (const FenError&) { threw = true; }
assert(threw);

threw = false;
try { Board x; set_from_fen(x, "r7/8/8/8/8/8/8/8 r 0"); } catch (const FenError&) { threw = true; }
assert(threw); // light square

threw = false;
try { Board x; set_from_fen(x, "8/8/8/8/8/8/8/8 w 0"); } catch (const FenError&) { threw = true; }
assert(threw);

threw = false;
try { Board x; set_from_fen(x, "8/8/8/8/8/8/8/8 r 99999999999999999999"); } catch (const FenError&) { threw = true; }
assert(threw); // clock too long for an int


return 0;
}
