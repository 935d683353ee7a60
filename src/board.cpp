#include "checkers/board.hpp"
#include "checkers/errors.hpp"
#include "checkers/move_do.hpp"
#include "checkers/movegen.hpp"
#include <string>


namespace checkers {


static inline U64 piece_key(Color c, bool king, Square s) {
return Zobrist::instance().piece_on[static_cast<std::size_t>(c)]
                                   [king ? 1u : 0u]
                                   [static_cast<std::size_t>(s)];
}


Board::Board() { clear(); }


void Board::clear() {
for (auto& by_color : bb_) for (auto& b : by_color) b = 0ULL;
stm_ = Color::Red;
reversible_ = 0;
hash_ = 0ULL;
}


Board Board::initial() {
Board b;
for (int row = 0; row < 3; ++row)
for (int col = 0; col < 8; ++col)
if (is_playable(make_square(row, col))) b.set_piece(make_square(row, col), man(Color::Black));
for (int row = 5; row < 8; ++row)
for (int col = 0; col < 8; ++col)
if (is_playable(make_square(row, col))) b.set_piece(make_square(row, col), man(Color::Red));
return b;
}


void Board::set_piece(Square s, Piece p) {
if (!is_playable(s))
  throw InvalidStateError("piece placed on non-playable square " + std::to_string(s));
remove_piece(s);
if (!p.king && row_of(s) == crown_row(p.color)) p = king(p.color);
bb_[static_cast<std::size_t>(p.color)][p.king ? 1u : 0u] |= (1ULL << s);
hash_ ^= piece_key(p.color, p.king, s);
}


void Board::remove_piece(Square s) {
if (s < 0 || s >= 64) return;
const U64 bit = 1ULL << s;
for (int c = 0; c < COLOR_N; ++c)
for (int k = 0; k < KIND_N; ++k) {
U64& bb = bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(k)];
if (bb & bit) {
  bb &= ~bit;
  hash_ ^= piece_key(static_cast<Color>(c), k == 1, s);
}
}
}


std::optional<Piece> Board::piece_at(Square s) const {
  if (s < 0 || s >= 64) return std::nullopt;
  for (int c = 0; c < COLOR_N; ++c) {
    for (int k = 0; k < KIND_N; ++k) {
      if ((bb_[static_cast<std::size_t>(c)][static_cast<std::size_t>(k)] >> s) & 1ULL) {
        return Piece{static_cast<Color>(c), k == 1};
      }
    }
  }
  return std::nullopt;
}


void Board::set_side_to_move(Color c) {
if (c == stm_) return;
hash_ ^= Zobrist::instance().side_to_move;
stm_ = c;
}


int Board::count(Color c) const {
return __builtin_popcountll(pieces(c));
}


MoveList Board::legal_moves(Color side, const Rules& rules) const {
MoveList ml;
generate_legal(*this, side, ml, rules);
return ml;
}


bool Board::is_terminal(const Rules& rules) const {
MoveList ml;
generate_legal(*this, ml, rules);
return ml.empty();
}


Board Board::apply(const Move& m, const Rules& rules) const {
const MoveList ml = legal_moves(stm_, rules);
for (const auto& cand : ml) {
  if (same_move(cand, m)) {
    Board next = *this;
    State st{};
    do_move(next, cand, st);
    return next;
  }
}
throw InvalidMoveError("move is not in the legal set for this position");
}


} // namespace checkers
