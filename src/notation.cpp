#include "checkers/notation.hpp"
#include "checkers/board.hpp"
#include "checkers/errors.hpp"
#include "checkers/movegen.hpp"
#include "checkers/types.hpp"

#include <cctype>
#include <string>
#include <vector>

namespace checkers {

std::string move_to_string(const Move& m) {
  if (m.is_null()) return "0000";
  const char sep = m.is_capture() ? 'x' : '-';
  std::string s = std::to_string(square_number(m.from));
  for (int i = 0; i < m.path_len; ++i) {
    s.push_back(sep);
    s += std::to_string(square_number(m.path[i]));
  }
  return s;
}

static std::vector<int> split_numbers(const std::string& text, char& sep) {
  std::vector<int> nums;
  sep = '\0';
  int cur = -1;
  for (char ch : text) {
    if (std::isdigit(static_cast<unsigned char>(ch))) {
      cur = (cur < 0 ? 0 : cur * 10) + (ch - '0');
      if (cur > 32) throw InvalidMoveError("square number out of range: " + text);
      continue;
    }
    if (ch != '-' && ch != 'x' && ch != 'X') throw InvalidMoveError("bad move text: " + text);
    const char norm = (ch == 'X' ? 'x' : ch);
    if (sep && sep != norm) throw InvalidMoveError("mixed separators: " + text);
    if (cur < 1) throw InvalidMoveError("missing square number: " + text);
    sep = norm;
    nums.push_back(cur);
    cur = -1;
  }
  if (cur < 1) throw InvalidMoveError("missing square number: " + text);
  nums.push_back(cur);
  if (nums.size() < 2) throw InvalidMoveError("move needs at least two squares: " + text);
  return nums;
}

Move parse_move(const Board& b, const std::string& text, const Rules& rules) {
  char sep = '\0';
  const std::vector<int> nums = split_numbers(text, sep);

  MoveList ml;
  generate_legal(b, ml, rules);

  const Move* found = nullptr;
  int matches = 0;
  for (const auto& m : ml) {
    if (square_number(m.from) != nums.front()) continue;
    if ((sep == 'x') != m.is_capture()) continue;

    bool ok;
    if (nums.size() == static_cast<std::size_t>(m.path_len) + 1) {
      ok = true;
      for (int i = 0; i < m.path_len; ++i)
        if (square_number(m.path[i]) != nums[static_cast<std::size_t>(i) + 1]) { ok = false; break; }
    } else {
      ok = nums.size() == 2 && square_number(m.to()) == nums.back();
    }
    if (ok) { found = &m; ++matches; }
  }

  if (matches == 0) throw InvalidMoveError("move not found among legal moves: " + text);
  if (matches > 1) throw InvalidMoveError("ambiguous move, list every landing square: " + text);
  return *found;
}

} // namespace checkers
