#pragma once
#include <array>
#include "checkers/board.hpp"
#include "checkers/move.hpp"

namespace checkers {

// Minimal reversible state for undo
struct State {
  Color  us{Color::Red};            // side who moved
  int    prev_reversible{0};
  Piece  moved{};                   // piece that moved (pre-crowning)
  std::array<Piece, MAX_CHAIN> captured{}; // what stood on m.captured[i]
};

// Throws InvalidMoveError (board untouched) when m does not fit the board:
// origin not owned by the side to move, occupied landing squares, jumps
// over empty or friendly squares, or a wrong promotion flag.
void do_move(Board& b, const Move& m, State& st);
void undo_move(Board& b, const Move& m, const State& st);

} // namespace checkers
