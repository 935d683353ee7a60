#pragma once
#include <cstdint>


namespace checkers {


using U64 = std::uint64_t;
using Square = int; // 0..63, row * 8 + col


enum class Color : int { Red = 0, Black = 1 };


constexpr int COLOR_N = 2;
constexpr int KIND_N = 2; // man, king


inline constexpr int col_of(Square s) { return s & 7; }
inline constexpr int row_of(Square s) { return s >> 3; }
inline constexpr Square make_square(int row, int col) { return row * 8 + col; }

inline constexpr bool on_board(int row, int col) {
  return row >= 0 && row < 8 && col >= 0 && col < 8;
}

// Dark squares only; nothing ever stands on a light square.
inline constexpr bool is_playable(Square s) {
  return s >= 0 && s < 64 && ((row_of(s) + col_of(s)) & 1) == 1;
}

inline constexpr Color other(Color c) {
  return c == Color::Red ? Color::Black : Color::Red;
}

// Row on which a man of colour c is crowned.
inline constexpr int crown_row(Color c) { return c == Color::Red ? 0 : 7; }

// Direction a man of colour c travels along rows.
inline constexpr int forward_dir(Color c) { return c == Color::Red ? -1 : +1; }

// Standard 1..32 numbering, counted left to right from row 0.
inline constexpr int square_number(Square s) { return row_of(s) * 4 + col_of(s) / 2 + 1; }

inline constexpr Square square_from_number(int n) {
  const int row = (n - 1) / 4;
  const int idx = (n - 1) % 4;
  return make_square(row, idx * 2 + ((row & 1) == 0 ? 1 : 0));
}


} // namespace checkers
