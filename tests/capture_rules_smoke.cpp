#include <cassert>
#include <initializer_list>
#include <iostream>
#include <random>
#include "checkers/board.hpp"
#include "checkers/movegen.hpp"
#include "checkers/rules.hpp"

using namespace checkers;

static bool was_taken(const Move& m, Square s) {
  for (int i = 0; i < m.cap_len; ++i) if (m.captured[i] == s) return true;
  return false;
}

// True if the piece that made capture `m` could jump once more from m.to().
static bool can_extend(const Board& b, const Move& m, bool asKing) {
  const Color us = b.piece_at(m.from)->color;
  const int r = row_of(m.to()), c = col_of(m.to());
  for (int dr : {-1, +1}) {
    if (!asKing && dr != forward_dir(us)) continue;
    for (int dc : {-1, +1}) {
      if (!on_board(r + 2 * dr, c + 2 * dc)) continue;
      const Square over = make_square(r + dr, c + dc);
      const Square land = make_square(r + 2 * dr, c + 2 * dc);
      const auto victim = b.piece_at(over);
      if (!victim || victim->color == us || was_taken(m, over)) continue;
      if (land == m.from || !b.piece_at(land)) return true;
    }
  }
  return false;
}

static void playout(std::mt19937& rng, const Rules& rules, int& captureNodes) {
  Board b = Board::initial();
  for (int ply = 0; ply < 150; ++ply) {
    const Color stm = b.side_to_move();
    MoveList ml = b.legal_moves(stm, rules);
    if (ml.empty()) return;

    // Any capture on the board makes every legal move a capture
    if (has_capture(b, stm)) {
      ++captureNodes;
      for (const auto& m : ml) assert(m.is_capture());
    } else {
      for (const auto& m : ml) assert(!m.is_capture());
    }

    // Chains stop only where no further jump exists
    for (const auto& m : ml) {
      if (!m.is_capture()) continue;
      const bool wasKing = b.piece_at(m.from)->king;
      if (m.promotes && rules.mid_chain_promotion == MidChainPromotion::EndsMove) continue;
      assert(!can_extend(b, m, wasKing || m.promotes));
    }

    std::uniform_int_distribution<std::size_t> pick(0, ml.size() - 1);
    b = b.apply(ml[pick(rng)], rules);
  }
}

int main() {
  for (MidChainPromotion variant : {MidChainPromotion::EndsMove, MidChainPromotion::ContinueAsKing}) {
    Rules rules{};
    rules.mid_chain_promotion = variant;
    std::mt19937 rng(2024u);
    int captureNodes = 0;
    for (int game = 0; game < 200; ++game) playout(rng, rules, captureNodes);
    assert(captureNodes > 100);
  }

  std::cout << "capture_rules_smoke ok\n";
  return 0;
}
