#pragma once
#include <array>
#include <cstdint>
#include "checkers/types.hpp"


namespace checkers {


// A side never has more than 12 pieces, so no chain is longer.
constexpr int MAX_CHAIN = 12;


// Either one quiet diagonal step (path_len == 1, cap_len == 0) or a chain of
// jumps with one captured square per landing square (cap_len == path_len).
struct Move {
Square from{-1};
std::array<Square, MAX_CHAIN> path{};
std::array<Square, MAX_CHAIN> captured{};
std::uint8_t path_len{0};
std::uint8_t cap_len{0};
bool promotes{false};

bool is_capture() const { return cap_len > 0; }
bool is_null() const { return from < 0 || path_len == 0; }
Square to() const { return path_len ? path[path_len - 1u] : from; }

void push_step(Square sq) { path[path_len++] = sq; }
void push_jump(Square over, Square land) {
  captured[cap_len++] = over;
  path[path_len++] = land;
}
};


inline bool same_move(const Move& a, const Move& b) {
  if (a.from != b.from || a.path_len != b.path_len || a.cap_len != b.cap_len) return false;
  for (int i = 0; i < a.path_len; ++i) if (a.path[i] != b.path[i]) return false;
  for (int i = 0; i < a.cap_len; ++i) if (a.captured[i] != b.captured[i]) return false;
  return a.promotes == b.promotes;
}


} // namespace checkers
