#include <iostream>
#include <sstream>
#include <string>
#include <vector>
#include <cstdint>
#include <exception>
#include <stdexcept>
#include <utility>

#include "checkers/types.hpp"
#include "checkers/board.hpp"
#include "checkers/ai.hpp"
#include "checkers/eval.hpp"
#include "checkers/fen.hpp"
#include "checkers/game.hpp"
#include "checkers/movegen.hpp"
#include "checkers/notation.hpp"
#include "checkers/perft.hpp"
#include "checkers/search.hpp"

using namespace checkers;

static void usage() {
  std::cout <<
    "Checkers CLI\n"
    "Usage:\n"
    "  checkers_cli perft <depth> [options] [fen <FEN...>]\n"
    "  checkers_cli divide <depth> [options] [fen <FEN...>]\n"
    "  checkers_cli moves [options] [fen <FEN...>]\n"
    "  checkers_cli eval [options] [fen <FEN...>]\n"
    "  checkers_cli search [options] [fen <FEN...>]\n"
    "  checkers_cli rank [options] [fen <FEN...>]\n"
    "  checkers_cli selfplay [plies <N>] [options] [fen <FEN...>]\n"
    "Options:\n"
    "  depth <N>  nodes <N>  movetime <ms>  king <value>  continue-as-king  minimax\n"
    "If FEN omitted, uses startpos.\n";
}

static std::string join_from(const std::vector<std::string>& a, size_t i) {
  if (i >= a.size()) return "";
  std::ostringstream oss;
  for (size_t k = i; k < a.size(); ++k) {
    if (k > i) oss << ' ';
    oss << a[k];
  }
  return oss.str();
}

static int to_int(const std::string& s) {
  return std::stoi(s);
}

static std::uint64_t to_u64(const std::string& s) {
  return static_cast<std::uint64_t>(std::stoull(s));
}

struct Options {
  SearchLimits lim{};
  int plies = 200;
  Board board = Board::initial();
};

// Parses keyword options from args[first..]; "fen" swallows the rest.
static Options parse_options(const std::vector<std::string>& args, size_t first) {
  Options o;
  o.lim.depth = 4;

  for (size_t i = first; i < args.size(); ++i) {
    const std::string& tok = args[i];

    if (tok == "fen") {
      set_from_fen(o.board, join_from(args, i + 1));
      break;
    }
    if (tok == "continue-as-king") {
      o.lim.rules.mid_chain_promotion = MidChainPromotion::ContinueAsKing;
      continue;
    }
    if (tok == "minimax") { o.lim.alpha_beta = false; continue; }
    if (i + 1 >= args.size()) throw std::invalid_argument("missing value for " + tok);

    const std::string& val = args[i + 1];
    if (tok == "depth")         { o.lim.depth = to_int(val); ++i; continue; }
    if (tok == "nodes")         { o.lim.nodes = to_u64(val); ++i; continue; }
    if (tok == "movetime")      { o.lim.movetime_ms = to_int(val); ++i; continue; }
    if (tok == "king")          { o.lim.weights.king = to_int(val); ++i; continue; }
    if (tok == "plies")         { o.plies = to_int(val); ++i; continue; }
    throw std::invalid_argument("unknown option " + tok);
  }
  return o;
}

static const char* color_name(Color c) { return c == Color::Red ? "red" : "black"; }

static int run(const std::vector<std::string>& args) {
  const std::string cmd = args[0];

  // perft <depth> ...
  if (cmd == "perft" || cmd == "divide") {
    if (args.size() < 2) { usage(); return 1; }
    const int depth = to_int(args[1]);
    Options o = parse_options(args, 2);
    if (cmd == "perft") {
      std::cout << perft(o.board, depth, o.lim.rules) << "\n";
      return 0;
    }
    std::vector<std::pair<Move, std::uint64_t>> parts;
    perft_divide(o.board, depth, parts, o.lim.rules);
    std::uint64_t total = 0;
    for (auto& [m, n] : parts) {
      std::cout << move_to_string(m) << " " << n << "\n";
      total += n;
    }
    std::cout << "total " << total << "\n";
    return 0;
  }

  Options o = parse_options(args, 1);

  if (cmd == "moves") {
    MoveList ml;
    generate_legal(o.board, ml, o.lim.rules);
    for (const auto& m : ml) std::cout << move_to_string(m) << (m.promotes ? " (crowns)" : "") << "\n";
    return 0;
  }

  if (cmd == "eval") {
    const Color stm = o.board.side_to_move();
    const EvalBreakdown e = evaluate_breakdown(o.board, stm, o.lim.weights, o.lim.rules);
    std::cout << to_ascii(o.board)
              << "eval " << e.total
              << " material " << e.material
              << " positional " << e.positional
              << " mobility " << e.mobility
              << " threats " << e.threats
              << " (" << color_name(stm) << " to move)\n";
    return 0;
  }

  if (cmd == "search") {
    AI ai(o.lim);
    const SearchResult r = ai.search(o.board, o.board.side_to_move());
    std::cout << "best " << move_to_string(r.best)
              << " score " << r.score
              << " depth " << r.depth
              << " nodes " << r.stats.nodes
              << " cutoffs " << r.stats.cutoffs
              << " seldepth " << r.stats.max_depth
              << " pv ";
    for (auto& m : r.pv) std::cout << move_to_string(m) << ' ';
    std::cout << "\n";
    return 0;
  }

  if (cmd == "rank") {
    AI ai(o.lim);
    for (const auto& sm : ai.evaluate_moves(o.board, o.board.side_to_move()))
      std::cout << move_to_string(sm.move) << " " << sm.score << "\n";
    return 0;
  }

  if (cmd == "selfplay") {
    const GameResult g = selfplay(o.board, o.plies, o.lim);
    for (const auto& m : g.moves) std::cout << move_to_string(m) << ' ';
    std::cout << "\nresult ";
    switch (g.outcome) {
      case GameOutcome::RedWin:   std::cout << "red wins"; break;
      case GameOutcome::BlackWin: std::cout << "black wins"; break;
      case GameOutcome::Draw:     std::cout << "draw"; break;
      case GameOutcome::Aborted:  std::cout << "aborted"; break;
    }
    std::cout << " (" << g.reason << ") plies " << g.plies << " nodes " << g.nodes << "\n";
    return 0;
  }

  usage();
  return 1;
}

int main(int argc, char** argv) {
  std::vector<std::string> args(argv + 1, argv + argc);
  if (args.empty()) { usage(); return 0; }

  try {
    return run(args);
  } catch (const std::exception& e) {
    std::cerr << "error: " << e.what() << "\n";
    return 1;
  }
}
