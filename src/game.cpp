#include "checkers/game.hpp"

#include "checkers/draw.hpp"
#include "checkers/move_do.hpp"
#include "checkers/movegen.hpp"

#include <atomic>
#include <utility>
#include <vector>

namespace checkers {

GameState game_state(const Board& b, const std::vector<U64>& history, const Rules& rules) {
  GameState gs{};
  MoveList ml;
  generate_legal(b, ml, rules);
  if (ml.empty()) {
    gs.kind = GameState::Kind::Won;
    gs.winner = other(b.side_to_move());
    return gs;
  }
  if (!history.empty() && is_rule_draw(b, history)) gs.kind = GameState::Kind::Drawn;
  return gs;
}

GameResult selfplay(Board start, int maxPlies, SearchLimits baseLimits) {
  GameResult out{};
  Board b = std::move(start);

  if (maxPlies < 0) maxPlies = 0;

  // History for threefold detection (draw.hpp expects history.back() = current key)
  std::vector<U64> hist;
  hist.reserve(static_cast<std::size_t>(maxPlies) + 1);
  hist.push_back(b.hash());

  // Ensure we have a sensible deterministic control knob.
  if (baseLimits.depth <= 0 && baseLimits.nodes == 0 && baseLimits.movetime_ms == 0) {
    baseLimits.depth = 2;
  }

  std::atomic<bool> stop{false};
  baseLimits.stop = &stop;

  for (int ply = 0; ply < maxPlies; ++ply) {
    const GameState gs = game_state(b, hist, baseLimits.rules);
    if (gs.kind == GameState::Kind::Drawn) {
      out.outcome = GameOutcome::Draw;
      out.reason = is_move_limit_draw(b) ? "move limit" : "threefold repetition";
      break;
    }
    if (gs.kind == GameState::Kind::Won) {
      out.outcome = (gs.winner == Color::Red) ? GameOutcome::RedWin : GameOutcome::BlackWin;
      out.reason = "no legal moves";
      break;
    }

    stop.store(false, std::memory_order_relaxed);
    SearchResult r = search(b, baseLimits);
    out.nodes += r.stats.nodes;
    if (r.best.is_null()) {
      out.outcome = GameOutcome::Aborted;
      out.reason = "no move selectable (internal error)";
      break;
    }

    State st{};
    do_move(b, r.best, st);
    out.moves.push_back(r.best);
    hist.push_back(b.hash());
  }

  out.plies = static_cast<int>(out.moves.size());

  // Hitting the ply cap counts as a draw.
  if (out.reason.empty()) {
    out.outcome = GameOutcome::Draw;
    out.reason = "max plies reached";
  }

  return out;
}

} // namespace checkers
