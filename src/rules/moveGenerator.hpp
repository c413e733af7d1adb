#pragma once

#include "rules/position.hpp"

#include <vector>

namespace banchess::rules {

//! Returns true if any piece of color 'by' attacks the square.
bool isSquareAttacked(const Position& pos, Square sq, Color by);

//! Square of the king of given color. NO_SQUARE if missing.
Square findKing(const Position& pos, Color color);

//! Check whether the king of given color is attacked.
bool isKingAttacked(const Position& pos, Color color);

//! All moves of the side to move, ignoring king safety. Castling already checks attacked squares.
std::vector<Move> pseudoLegalMoves(const Position& pos);

//! Play a chess move on the board. Updates side to move, castling rights, en passant and move counters.
//! \note Does not validate the move and does not touch the ban state.
Position makeMove(const Position& pos, const Move& move);

//! All moves of the side to move that do not leave the own king in check.
std::vector<Move> legalMoves(const Position& pos);

} // namespace banchess::rules
