#include "checkers/zobrist.hpp"


namespace checkers {


const Zobrist& Zobrist::instance() {
static const Zobrist z = [] { Zobrist t; t.init(); return t; }();
return z;
}


void Zobrist::init(std::uint64_t seed) {
// Deterministic but non-trivial distribution
std::uint64_t x = seed;
auto next = [&]() -> std::uint64_t { return splitmix64(x); };


for (int c = 0; c < COLOR_N; ++c)
for (int k = 0; k < KIND_N; ++k)
for (int s = 0; s < 64; ++s)
piece_on[static_cast<std::size_t>(c)]
[static_cast<std::size_t>(k)]
[static_cast<std::size_t>(s)] = next();


side_to_move = next();
}


} // namespace checkers
