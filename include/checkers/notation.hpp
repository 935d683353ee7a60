// include/checkers/notation.hpp
#pragma once
#include <string>

#include "checkers/rules.hpp"

namespace checkers {

struct Move;
class Board;

// Standard numbered notation: "11-15" for a step, "22x15x8" for a capture chain.
std::string move_to_string(const Move& m);

// Finds the legal move on `b` written as `text`. A capture may be written
// with every landing square or, when unambiguous, just origin and final square.
// Throws InvalidMoveError if no legal move (or more than one) matches.
Move parse_move(const Board& b, const std::string& text, const Rules& rules = {});

} // namespace checkers
