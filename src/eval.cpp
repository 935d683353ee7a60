#include "checkers/eval.hpp"
#include "checkers/movegen.hpp"
#include "checkers/types.hpp"

namespace checkers {

static inline int popcount(U64 bb) { return __builtin_popcountll(bb); }

static inline bool is_center(Square s) {
  const int r = row_of(s), c = col_of(s);
  return r >= 2 && r <= 5 && c >= 2 && c <= 5;
}

static inline bool is_edge(Square s) {
  const int c = col_of(s);
  return c == 0 || c == 7;
}

// Rows a man of colour c has travelled from its own back row.
static inline int rows_advanced(Color c, Square s) {
  return c == Color::Red ? 7 - row_of(s) : row_of(s);
}

static int material(const Board& b, Color c, const EvalWeights& w) {
  return popcount(b.men(c)) * w.man + popcount(b.kings(c)) * w.king;
}

static int positional(const Board& b, Color c, const EvalWeights& w) {
  int score = 0;

  U64 all = b.pieces(c);
  while (all) {
    const Square s = __builtin_ctzll(all);
    all &= all - 1;
    if (is_center(s)) score += w.center;
    if (is_edge(s))   score += w.edge;
  }

  U64 men = b.men(c);
  while (men) {
    const Square s = __builtin_ctzll(men);
    men &= men - 1;
    const int adv = rows_advanced(c, s);
    if (adv == 0) score += w.back_row;
    score += adv * w.advancement;
    if (adv >= 5) score += w.promotion_zone;
  }
  return score;
}

struct MoveTerms {
  int mobility = 0;
  int threats = 0;
};

// Both terms come from one generation: the list holds only captures when any exist.
static MoveTerms move_terms(const Board& b, Color c, const EvalWeights& w, const Rules& rules) {
  MoveTerms t;
  if (w.mobility == 0 && w.capture_threat == 0) return t;
  MoveList ml;
  generate_moves(b, c, ml, rules);
  const int n = static_cast<int>(ml.size());
  t.mobility = n * w.mobility;
  if (!ml.empty() && ml[0].is_capture()) t.threats = n * w.capture_threat;
  return t;
}

EvalBreakdown evaluate_breakdown(const Board& b, Color perspective,
                                 const EvalWeights& w, const Rules& rules) {
  // Always Red minus Black, then flipped: antisymmetric by construction.
  EvalBreakdown e;
  e.material   = material(b, Color::Red, w)   - material(b, Color::Black, w);
  e.positional = positional(b, Color::Red, w) - positional(b, Color::Black, w);

  const MoveTerms red = move_terms(b, Color::Red, w, rules);
  const MoveTerms black = move_terms(b, Color::Black, w, rules);
  e.mobility   = red.mobility - black.mobility;
  e.threats    = red.threats - black.threats;

  if (perspective == Color::Black) {
    e.material   = -e.material;
    e.positional = -e.positional;
    e.mobility   = -e.mobility;
    e.threats    = -e.threats;
  }
  e.total = e.material + e.positional + e.mobility + e.threats;
  return e;
}

int evaluate(const Board& b, Color perspective, const EvalWeights& w, const Rules& rules) {
  return evaluate_breakdown(b, perspective, w, rules).total;
}

} // namespace checkers
