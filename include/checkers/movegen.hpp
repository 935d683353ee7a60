#pragma once
#include "checkers/board.hpp"
#include "checkers/movelist.hpp"
#include "checkers/rules.hpp"


namespace checkers {


// Moves for `side` regardless of whose turn it is: captures only when any
// exist, every capture chain extended until no further jump is possible.
void generate_moves(const Board& b, Color side, MoveList& out, const Rules& rules = {});

// Same set, but `side` must be the side to move (InvalidStateError otherwise).
void generate_legal(const Board& b, Color side, MoveList& out, const Rules& rules = {});
void generate_legal(const Board& b, MoveList& out, const Rules& rules = {});

// True if `side` has at least one jump available.
bool has_capture(const Board& b, Color side);


} // namespace checkers
