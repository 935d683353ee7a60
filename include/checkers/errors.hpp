#pragma once
#include <stdexcept>

namespace checkers {

// Move generation was asked for a side that is not to move, or the board
// itself is malformed.
struct InvalidStateError : std::runtime_error { using std::runtime_error::runtime_error; };

// A move that does not fit the board it is applied to (stale or hand-built).
struct InvalidMoveError : std::runtime_error { using std::runtime_error::runtime_error; };

// Search requested for a side that has no legal move.
struct NoLegalMoveError : std::runtime_error { using std::runtime_error::runtime_error; };

} // namespace checkers
