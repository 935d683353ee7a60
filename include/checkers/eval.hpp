#pragma once
#include "checkers/board.hpp"
#include "checkers/rules.hpp"

namespace checkers {

// Weights in hundredths of a man.
struct EvalWeights {
  int man = 100;
  int king = 300;
  int center = 10;          // per piece on the central 4x4 block
  int back_row = 20;        // per man still guarding its own back row
  int advancement = 4;      // per row a man has advanced
  int edge = 5;             // per piece on the side columns
  int promotion_zone = 25;  // per man within two rows of crowning
  int mobility = 2;         // per available move
  int capture_threat = 15;  // per capture move available
};

struct EvalBreakdown {
  int material = 0;
  int positional = 0;
  int mobility = 0;
  int threats = 0;
  int total = 0;
};

// Score from `perspective`'s point of view: positive = perspective better.
// evaluate(b, Red) == -evaluate(b, Black) for every board.
int evaluate(const Board& b, Color perspective, const EvalWeights& w = {},
             const Rules& rules = {});

EvalBreakdown evaluate_breakdown(const Board& b, Color perspective,
                                 const EvalWeights& w = {}, const Rules& rules = {});

} // namespace checkers
