#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "checkers/board.hpp"
#include "checkers/move.hpp"
#include "checkers/search.hpp"

namespace checkers {

// Derived on demand, never stored on the board.
struct GameState {
  enum class Kind { Ongoing, Won, Drawn };
  Kind kind = Kind::Ongoing;
  Color winner = Color::Red;     // meaningful only for Won
};

// A side to move without legal moves has lost. Draw rules apply only when a
// position history is supplied (history.back() = current key).
GameState game_state(const Board& b, const std::vector<U64>& history = {},
                     const Rules& rules = {});

enum class GameOutcome { RedWin, BlackWin, Draw, Aborted };

struct GameResult {
  GameOutcome outcome = GameOutcome::Aborted;
  int plies = 0;                 // number of half-moves played
  std::vector<Move> moves;       // moves played from the starting position
  std::string reason;            // human-readable termination reason
  std::uint64_t nodes = 0;       // total nodes searched across plies
};

// Deterministic self-play: both sides use search() with the same limits.
// The stop pointer in baseLimits is ignored and replaced internally.
GameResult selfplay(Board start, int maxPlies, SearchLimits baseLimits);

} // namespace checkers
