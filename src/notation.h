#pragma once

#include <optional>
#include <string>

class Board;
struct Move;

// Standard algebraic notation for a legal move, with check and mate suffixes.
std::string move_to_san(const Board& positionBeforeMove, const Move& move);

// Resolves a SAN token against the legal moves of the position. Accepts "0-0" castling,
// trailing annotation glyphs (+ # ! ?) and promotions with or without '='.
// Returns std::nullopt when the token is malformed, illegal or ambiguous.
std::optional<Move> san_to_move(const Board& position, const std::string& san);
