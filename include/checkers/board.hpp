#pragma once
#include <array>
#include <cstdint>
#include <optional>
#include "checkers/movelist.hpp"
#include "checkers/piece.hpp"
#include "checkers/rules.hpp"
#include "checkers/types.hpp"
#include "checkers/zobrist.hpp"


namespace checkers {


class Board {
public:
Board();
void clear();

// Standard opening setup: 12 men each, Red on rows 5..7, Red to move.
static Board initial();


// A man placed on its crown row is stored as a king.
// Throws InvalidStateError for light or off-board squares.
void set_piece(Square s, Piece p);
void remove_piece(Square s);
std::optional<Piece> piece_at(Square s) const;


void set_side_to_move(Color c);
Color side_to_move() const { return stm_; }


// Plies since the last capture or man move.
void set_reversible_plies(int n) { reversible_ = n; }
int reversible_plies() const { return reversible_; }


U64 men(Color c) const { return bb_[static_cast<std::size_t>(c)][0]; }
U64 kings(Color c) const { return bb_[static_cast<std::size_t>(c)][1]; }
U64 pieces(Color c) const { return men(c) | kings(c); }
U64 occupied() const { return pieces(Color::Red) | pieces(Color::Black); }
int count(Color c) const;


U64 hash() const { return hash_; }


// Complete legal set for `side`; throws InvalidStateError unless side is to move.
MoveList legal_moves(Color side, const Rules& rules = {}) const;
bool is_terminal(const Rules& rules = {}) const;

// Successor board. Throws InvalidMoveError unless m is in the current legal set.
Board apply(const Move& m, const Rules& rules = {}) const;


private:
// bb_[color][kind]
std::array<std::array<U64, KIND_N>, COLOR_N> bb_{};
Color stm_ = Color::Red;
int reversible_ = 0;
U64 hash_ = 0ULL;
};


} // namespace checkers
