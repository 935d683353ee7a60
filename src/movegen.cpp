#include "checkers/movegen.hpp"
#include "checkers/errors.hpp"
#include "checkers/types.hpp"
#include "checkers/board.hpp"

namespace checkers {

// Diagonal directions as (row, col) deltas.
static constexpr int DR[4] = {-1, -1, +1, +1};
static constexpr int DC[4] = {-1, +1, -1, +1};

static inline bool bit_set(U64 bb, Square s) { return (bb >> s) & 1ULL; }

static inline bool may_go(bool king, Color us, int dir) {
  return king || DR[dir] == forward_dir(us);
}

namespace {

// Depth-first walk over one piece's jump tree. Jumped pieces stay on the
// board until the move completes: they cannot be jumped twice and their
// squares are never landing squares. The origin is vacated up front.
struct JumpWalker {
  const Rules& rules;
  Color us;
  U64 enemies;
  U64 blocked;     // occupancy with the moving piece lifted off its origin
  MoveList& out;

  // Returns true if at least one jump was found from `cur`.
  bool walk(Move& m, Square cur, bool king, U64 taken) {
    bool found = false;
    const int r0 = row_of(cur), c0 = col_of(cur);

    for (int dir = 0; dir < 4; ++dir) {
      if (!may_go(king, us, dir)) continue;
      const int r1 = r0 + DR[dir], c1 = c0 + DC[dir];
      const int r2 = r1 + DR[dir], c2 = c1 + DC[dir];
      if (!on_board(r2, c2)) continue;

      const Square over = make_square(r1, c1);
      const Square land = make_square(r2, c2);
      if (!bit_set(enemies, over) || bit_set(taken, over)) continue;
      if (bit_set(blocked, land)) continue;
      if (m.cap_len >= MAX_CHAIN) continue;

      found = true;
      m.push_jump(over, land);
      const bool was_promotes = m.promotes;
      const bool crowned = !king && r2 == crown_row(us);

      if (crowned) {
        m.promotes = true;
        if (rules.mid_chain_promotion == MidChainPromotion::EndsMove ||
            !walk(m, land, true, taken | (1ULL << over))) {
          out.push(m);
        }
      } else if (!walk(m, land, king, taken | (1ULL << over))) {
        out.push(m); // maximal: nothing follows from here
      }

      m.promotes = was_promotes;
      --m.path_len;
      --m.cap_len;
    }
    return found;
  }
};

} // namespace

static void generate_captures(const Board& b, Color us, MoveList& out, const Rules& rules) {
  const U64 own = b.pieces(us);
  const U64 kings = b.kings(us);
  U64 bb = own;
  while (bb) {
    const Square s = __builtin_ctzll(bb);
    bb &= bb - 1;

    JumpWalker w{rules, us, b.pieces(other(us)), b.occupied() & ~(1ULL << s), out};
    Move m{};
    m.from = s;
    (void)w.walk(m, s, bit_set(kings, s), 0ULL);
  }
}

static void generate_steps(const Board& b, Color us, MoveList& out) {
  const U64 occ = b.occupied();
  const U64 kings = b.kings(us);
  U64 bb = b.pieces(us);
  while (bb) {
    const Square s = __builtin_ctzll(bb);
    bb &= bb - 1;
    const bool king = bit_set(kings, s);

    for (int dir = 0; dir < 4; ++dir) {
      if (!may_go(king, us, dir)) continue;
      const int r = row_of(s) + DR[dir], c = col_of(s) + DC[dir];
      if (!on_board(r, c)) continue;
      const Square t = make_square(r, c);
      if (bit_set(occ, t)) continue;

      Move m{};
      m.from = s;
      m.push_step(t);
      m.promotes = !king && r == crown_row(us);
      out.push(m);
    }
  }
}

bool has_capture(const Board& b, Color us) {
  const U64 occ = b.occupied();
  const U64 enemies = b.pieces(other(us));
  const U64 kings = b.kings(us);
  U64 bb = b.pieces(us);
  while (bb) {
    const Square s = __builtin_ctzll(bb);
    bb &= bb - 1;
    const bool king = bit_set(kings, s);
    for (int dir = 0; dir < 4; ++dir) {
      if (!may_go(king, us, dir)) continue;
      const int r2 = row_of(s) + 2 * DR[dir], c2 = col_of(s) + 2 * DC[dir];
      if (!on_board(r2, c2)) continue;
      const Square over = make_square(row_of(s) + DR[dir], col_of(s) + DC[dir]);
      if (bit_set(enemies, over) && !bit_set(occ, make_square(r2, c2))) return true;
    }
  }
  return false;
}

void generate_moves(const Board& b, Color side, MoveList& out, const Rules& rules) {
  out.clear();
  generate_captures(b, side, out, rules);
  if (!out.empty()) return; // mandatory capture
  generate_steps(b, side, out);
}

void generate_legal(const Board& b, Color side, MoveList& out, const Rules& rules) {
  if (side != b.side_to_move())
    throw InvalidStateError("move generation requested for the side not to move");
  generate_moves(b, side, out, rules);
}

void generate_legal(const Board& b, MoveList& out, const Rules& rules) {
  generate_moves(b, b.side_to_move(), out, rules);
}

} // namespace checkers
