#pragma once
#include "checkers/types.hpp"


namespace checkers {


// Crowning replaces the value, it never mutates one in place.
struct Piece {
Color color{Color::Red};
bool king{false};
};


inline constexpr bool operator==(const Piece& a, const Piece& b) {
return a.color == b.color && a.king == b.king;
}


inline constexpr Piece man(Color c) { return Piece{c, false}; }
inline constexpr Piece king(Color c) { return Piece{c, true}; }


} // namespace checkers
