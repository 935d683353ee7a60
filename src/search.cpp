#include "checkers/search.hpp"
#include "checkers/movegen.hpp"
#include "checkers/move_do.hpp"
#include "checkers/eval.hpp"
#include "checkers/types.hpp"

#include <algorithm>
#include <atomic>
#include <chrono>
#include <cstdint>
#include <utility>
#include <vector>

namespace checkers {
namespace {

constexpr int INF = WIN_SCORE + 1000;

// -----------------------------------------------------------------------------
// Per-call search context: owned by the top-level call, passed by reference
// -----------------------------------------------------------------------------
struct Context {
  const SearchLimits& lim;
  SearchStats& stats;
  bool has_deadline = false;
  std::chrono::steady_clock::time_point deadline{};
  bool aborted = false;

  // Node-entry budget check. Once tripped it stays tripped for the call.
  bool out_of_budget() {
    if (aborted) return true;
    if (lim.nodes != 0 && stats.nodes >= lim.nodes) aborted = true;
    else if (lim.stop && lim.stop->load(std::memory_order_relaxed)) aborted = true;
    else if (has_deadline && (stats.nodes & 0x3FF) == 0 &&
             std::chrono::steady_clock::now() >= deadline) aborted = true;

    if (aborted && lim.stop) lim.stop->store(true, std::memory_order_relaxed);
    return aborted;
  }
};

// -----------------------------------------------------------------------------
// Negamax with alpha-beta (fail-soft). Every score is from the side to move.
// -----------------------------------------------------------------------------
int negamax(Board& b, int depth, int alpha, int beta, int ply,
            std::vector<Move>& pv, Context& ctx)
{
  if (ctx.out_of_budget()) { pv.clear(); return 0; }

  ctx.stats.nodes++;
  if (ply > ctx.stats.max_depth) ctx.stats.max_depth = ply;

  MoveList ml;
  generate_legal(b, ml, ctx.lim.rules);

  if (ml.empty()) {              // side to move is lost
    pv.clear();
    return -(WIN_SCORE - ply);
  }
  if (depth <= 0) {
    pv.clear();
    return evaluate(b, b.side_to_move(), ctx.lim.weights, ctx.lim.rules);
  }

  order_moves(ml);

  int bestScore = -INF;
  std::vector<Move> childPV;

  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    childPV.clear();
    const int score = -negamax(b, depth - 1, -beta, -alpha, ply + 1, childPV, ctx);
    undo_move(b, m, st);

    if (ctx.aborted) { pv.clear(); return 0; }

    // strict: the first of equal moves keeps the slot
    if (score > bestScore) {
      bestScore = score;
      pv.clear();
      pv.push_back(m);
      pv.insert(pv.end(), childPV.begin(), childPV.end());
    }

    if (!ctx.lim.alpha_beta) continue;
    if (bestScore > alpha) alpha = bestScore;
    if (alpha >= beta) {
      ctx.stats.cutoffs++;
      break;
    }
  }

  return bestScore;
}

Context make_context(const SearchLimits& lim, SearchStats& stats) {
  Context ctx{lim, stats};
  if (lim.movetime_ms > 0) {
    ctx.has_deadline = true;
    ctx.deadline = std::chrono::steady_clock::now() + std::chrono::milliseconds(lim.movetime_ms);
  }
  return ctx;
}

} // namespace

void order_moves(MoveList& ml) {
  std::stable_sort(ml.begin(), ml.end(),
    [](const Move& a, const Move& c){ return a.cap_len > c.cap_len; });
}

// -----------------------------------------------------------------------------
// Iterative deepening driver
// -----------------------------------------------------------------------------
SearchResult search(const Board& root, const SearchLimits& lim) {
  SearchResult res{};
  const int maxDepth = lim.depth > 0 ? lim.depth : DEFAULT_DEPTH;

  Board b = root;
  Context ctx = make_context(lim, res.stats);

  for (int d = 1; d <= maxDepth; ++d) {
    std::vector<Move> pv;
    const int score = negamax(b, d, -INF, +INF, 0, pv, ctx);

    if (ctx.aborted) {
      res.aborted = true;
      break;
    }

    res.score = score;
    res.depth = d;
    res.best  = pv.empty() ? Move{} : pv.front();
    res.pv    = std::move(pv);

    if (res.pv.empty()) break;   // terminal root: deeper iterations say the same
  }

  // Interrupted before the first iteration finished: fall back to the first
  // move in search order so a legal move is still returned.
  if (res.depth == 0 && res.aborted) {
    MoveList ml;
    generate_legal(root, ml, lim.rules);
    if (!ml.empty()) {
      order_moves(ml);
      res.best = ml[0];
      res.pv.assign(1, ml[0]);
    }
  }

  return res;
}

SearchResult search(const Board& root, int maxDepth) {
  SearchLimits lim{};
  lim.depth = std::max(1, maxDepth);
  return search(root, lim);
}

std::vector<ScoredMove> rank_moves(const Board& root, const SearchLimits& lim) {
  const int depth = lim.depth > 0 ? lim.depth : DEFAULT_DEPTH;

  SearchStats stats{};
  Context ctx = make_context(lim, stats);
  Board b = root;

  MoveList ml;
  generate_legal(b, ml, lim.rules);
  order_moves(ml);

  std::vector<ScoredMove> out;
  out.reserve(ml.size());
  for (const auto& m : ml) {
    State st{};
    do_move(b, m, st);
    std::vector<Move> pv;
    const int score = -negamax(b, depth - 1, -INF, +INF, 1, pv, ctx);
    undo_move(b, m, st);
    if (ctx.aborted) break;
    out.push_back(ScoredMove{m, score});
  }

  std::stable_sort(out.begin(), out.end(),
    [](const ScoredMove& a, const ScoredMove& c){ return a.score > c.score; });
  return out;
}

} // namespace checkers
