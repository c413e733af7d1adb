#pragma once

#include "rules/types.hpp"

#include <array>
#include <optional>
#include <string>
#include <string_view>

namespace banchess::rules {

//! Castling right bits.
enum CastlingRight : std::uint8_t {
	CASTLE_NONE        = 0,
	CASTLE_WHITE_SHORT = 1 << 0,
	CASTLE_WHITE_LONG  = 1 << 1,
	CASTLE_BLACK_SHORT = 1 << 2,
	CASTLE_BLACK_LONG  = 1 << 3,
	CASTLE_ALL         = 0x0F,
};

//! Complete game position including the pending ban/move phase.
struct Position {
	std::array<Piece, 64> board{};          //!< Mailbox board, index = rank * 8 + file.
	Color sideToMove{Color::White};         //!< Color that plays the next chess move.
	std::uint8_t castling{CASTLE_ALL};      //!< CastlingRight bits.
	Square enPassant{NO_SQUARE};            //!< Target square of an en passant capture.
	unsigned halfmoveClock{0};              //!< Plies since the last capture or pawn move.
	unsigned fullmoveNumber{1};             //!< Starts at 1, incremented after Black moves.
	ActionType pending{ActionType::Ban};    //!< Next action kind.
	std::optional<Move> bannedMove{};       //!< Set while a move is pending and a ban was placed.

	bool operator==(const Position&) const = default;

	//! Color that performs the pending action.
	Color actor() const {
		return pending == ActionType::Ban ? opponent(sideToMove) : sideToMove;
	}

	Piece at(Square sq) const {
		return board[sq];
	}

	//! Standard start position, a ban pending (Black bans first).
	static Position initial();

	//! Parse FEN. Accepts six standard fields and an optional seventh ban field ("ban", "move", "move:e2e4").
	static std::optional<Position> fromFen(std::string_view fen);

	//! Extended FEN, always with the seventh ban field.
	std::string toFen() const;
};

inline constexpr std::string_view START_FEN = "rnbqkbnr/pppppppp/8/8/8/8/PPPPPPPP/RNBQKBNR w KQkq - 0 1 ban";

} // namespace banchess::rules
