#pragma once
#include <string>
#include <string_view>
#include <stdexcept>
#include "checkers/board.hpp"

namespace checkers {

struct FenError : std::runtime_error { using std::runtime_error::runtime_error; };

// Rows are listed from row 0 (Black's back row) down to row 7.
// b/B = black man/king, r/R = red man/king, digits = empty runs.
// Fields: placement, side to move (r|b), optional reversible-ply clock.
inline constexpr char STARTPOS_FEN[] =
  "1b1b1b1b/b1b1b1b1/1b1b1b1b/8/8/r1r1r1r1/1r1r1r1r/r1r1r1r1 r 0";

void set_from_fen(Board& b, std::string_view fen);
std::string to_fen(const Board& b);

// Eight text lines, row 0 first, '.' for empty dark squares, ' ' for light ones.
std::string to_ascii(const Board& b);

} // namespace checkers
