#include "checkers/move_do.hpp"
#include "checkers/errors.hpp"
#include <cstdlib>

namespace checkers {

static inline bool diagonal(Square a, Square b, int dist) {
  return std::abs(row_of(a) - row_of(b)) == dist && std::abs(col_of(a) - col_of(b)) == dist;
}

// Walks the path against the current board without touching it. Fills the
// captured pieces into st and returns whether the mover ends up crowned.
static bool check_move(const Board& b, const Move& m, State& st) {
  if (m.is_null() || m.path_len > MAX_CHAIN)
    throw InvalidMoveError("empty move");
  if (m.cap_len != 0 && m.cap_len != m.path_len)
    throw InvalidMoveError("capture count does not match path length");
  if (m.cap_len == 0 && m.path_len != 1)
    throw InvalidMoveError("a quiet move is a single step");

  const auto mover = b.piece_at(m.from);
  if (!mover || mover->color != b.side_to_move())
    throw InvalidMoveError("origin does not hold a piece of the side to move");

  const Color us = mover->color;
  const U64 occ = b.occupied() & ~(1ULL << m.from);
  const U64 enemies = b.pieces(other(us));
  bool king = mover->king;
  U64 taken = 0ULL;
  Square cur = m.from;

  for (int i = 0; i < m.path_len; ++i) {
    const Square to = m.path[i];
    if (!is_playable(to) || ((occ >> to) & 1ULL))
      throw InvalidMoveError("landing square is not empty");

    if (m.cap_len == 0) {
      if (!diagonal(cur, to, 1)) throw InvalidMoveError("step is not a diagonal neighbour");
    } else {
      const Square over = m.captured[i];
      if (!diagonal(cur, to, 2) || over != (cur + to) / 2)
        throw InvalidMoveError("jump does not pass over the captured square");
      if (!((enemies >> over) & 1ULL) || ((taken >> over) & 1ULL))
        throw InvalidMoveError("jumped square does not hold an uncaptured enemy piece");
      taken |= 1ULL << over;
      st.captured[static_cast<std::size_t>(i)] = *b.piece_at(over);
    }

    if (!king && (row_of(to) - row_of(cur)) * forward_dir(us) < 0)
      throw InvalidMoveError("man moving backwards");
    if (!king && row_of(to) == crown_row(us)) king = true;
    cur = to;
  }

  const bool crowned = king && !mover->king;
  if (crowned != m.promotes)
    throw InvalidMoveError("promotion flag does not match the move");
  return crowned;
}

void do_move(Board& b, const Move& m, State& st) {
  const bool crowned = check_move(b, m, st);

  st.us              = b.side_to_move();
  st.prev_reversible = b.reversible_plies();
  st.moved           = *b.piece_at(m.from);

  b.remove_piece(m.from);
  for (int i = 0; i < m.cap_len; ++i) b.remove_piece(m.captured[i]);
  b.set_piece(m.to(), crowned ? king(st.us) : st.moved);

  // reversible clock: reset on any capture or man move
  if (m.is_capture() || !st.moved.king) b.set_reversible_plies(0);
  else b.set_reversible_plies(st.prev_reversible + 1);

  b.set_side_to_move(other(st.us));
}

void undo_move(Board& b, const Move& m, const State& st) {
  b.set_side_to_move(st.us);
  b.set_reversible_plies(st.prev_reversible);

  b.remove_piece(m.to());
  b.set_piece(m.from, st.moved);
  for (int i = 0; i < m.cap_len; ++i) {
    b.set_piece(m.captured[i], st.captured[static_cast<std::size_t>(i)]);
  }
}

} // namespace checkers
