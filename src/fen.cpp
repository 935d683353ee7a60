#include "checkers/fen.hpp"
#include "checkers/errors.hpp"
#include <sstream>
#include <string>   // ensure operator>> into std::string is visible

namespace checkers {

static inline bool is_digit(char c) { return c >= '0' && c <= '9'; }

static inline bool char_to_piece(char c, Piece& out) {
  switch (c) {
    case 'r': out = man(Color::Red);    return true;
    case 'R': out = king(Color::Red);   return true;
    case 'b': out = man(Color::Black);  return true;
    case 'B': out = king(Color::Black); return true;
    default:  return false;
  }
}

static inline char piece_to_char(const Piece& p) {
  if (p.color == Color::Red) return p.king ? 'R' : 'r';
  return p.king ? 'B' : 'b';
}

void set_from_fen(Board& b, std::string_view fen) {
  b.clear();

  std::string fen_str(fen);
  std::istringstream ss(fen_str);
  std::string placement, active, clock;
  if (!(ss >> placement >> active))
    throw FenError("Malformed position: expected placement and side to move");
  ss >> clock;

  // 1) Piece placement
  int r = 0, c = 0;
  for (char ch : placement) {
    if (ch == '/') {
      if (c != 8) throw FenError("Row does not cover 8 columns");
      ++r; c = 0; continue;
    }
    if (is_digit(ch)) { c += ch - '0'; continue; }
    Piece p{};
    if (!char_to_piece(ch, p)) throw FenError("Invalid piece character in position");
    if (!on_board(r, c)) throw FenError("Square out of range while parsing position");
    try {
      b.set_piece(make_square(r, c), p);
    } catch (const InvalidStateError& e) {
      throw FenError(e.what());
    }
    ++c;
  }
  if (r != 7 || c != 8) throw FenError("Placement must describe 8 rows of 8 columns");

  // 2) Active color
  if (active == "r") b.set_side_to_move(Color::Red);
  else if (active == "b") b.set_side_to_move(Color::Black);
  else throw FenError("Invalid side to move in position");

  // 3) Reversible-ply clock
  if (!clock.empty()) {
    for (char ch : clock)
      if (!is_digit(ch)) throw FenError("Invalid ply clock in position");
    if (clock.size() > 6) throw FenError("Ply clock out of range in position");
    b.set_reversible_plies(std::stoi(clock));
  }
}

std::string to_fen(const Board& b) {
  std::string out;

  // 1) Piece placement
  for (int r = 0; r < 8; ++r) {
    int empties = 0;
    for (int c = 0; c < 8; ++c) {
      const auto p = b.piece_at(make_square(r, c));
      if (!p) {
        ++empties;
      } else {
        if (empties) { out += char('0' + empties); empties = 0; }
        out += piece_to_char(*p);
      }
    }
    if (empties) out += char('0' + empties);
    if (r != 7) out += '/';
  }
  out += ' ';

  // 2) Active color
  out += (b.side_to_move() == Color::Red ? 'r' : 'b');
  out += ' ';

  // 3) Clock
  out += std::to_string(b.reversible_plies());
  return out;
}

std::string to_ascii(const Board& b) {
  std::string out;
  for (int r = 0; r < 8; ++r) {
    for (int c = 0; c < 8; ++c) {
      const Square s = make_square(r, c);
      if (!is_playable(s)) { out += ' '; continue; }
      const auto p = b.piece_at(s);
      out += p ? piece_to_char(*p) : '.';
    }
    out += '\n';
  }
  return out;
}

} // namespace checkers
