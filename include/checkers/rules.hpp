#pragma once

namespace checkers {

// What happens when a man lands on its crown row in the middle of a capture.
enum class MidChainPromotion : int {
  EndsMove = 0,       // crowned, and the move stops there (English/American rules)
  ContinueAsKing = 1  // crowned at once, further jumps use king movement
};

struct Rules {
  MidChainPromotion mid_chain_promotion = MidChainPromotion::EndsMove;
};

} // namespace checkers
