#pragma once

#include <cstdint>
#include <optional>
#include <string>
#include <string_view>

namespace banchess::rules {

using Square = std::uint8_t; //!< Board index: rank * 8 + file. a1 = 0, h8 = 63.

inline constexpr Square NO_SQUARE = 64;

enum class Color : std::uint8_t { White = 0, Black = 1 };

//! Returns the opponent of the input color.
inline constexpr Color opponent(Color color) {
	return color == Color::White ? Color::Black : Color::White;
}

enum class PieceType : std::uint8_t { None = 0, Pawn, Knight, Bishop, Rook, Queen, King };

struct Piece {
	PieceType type{PieceType::None};
	Color color{Color::White};

	bool operator==(const Piece&) const = default;
};

inline constexpr Square makeSquare(int file, int rank) {
	return static_cast<Square>(rank * 8 + file);
}
inline constexpr int fileOf(Square sq) {
	return sq % 8;
}
inline constexpr int rankOf(Square sq) {
	return sq / 8;
}

//! A chess move. Also used as the payload of a ban, where promotion is ignored.
struct Move {
	Square from{NO_SQUARE};
	Square to{NO_SQUARE};
	PieceType promotion{PieceType::None};

	bool operator==(const Move&) const = default;

	//! Same origin and target square. Bans are matched this way.
	bool sameSquares(const Move& other) const {
		return from == other.from && to == other.to;
	}
};

enum class ActionType : std::uint8_t { Ban, Move };

//! One step of the game: either a ban of an opponent move or a move.
struct Action {
	ActionType type{ActionType::Move};
	Move move{};

	bool operator==(const Action&) const = default;
};

std::string toString(Color color);                       //!< "white" / "black".
std::optional<Color> colorFromString(std::string_view s); //!< Inverse of toString(Color).
std::string toString(ActionType type);                   //!< "ban" / "move".

std::string squareName(Square sq);                       //!< "e4".
std::optional<Square> parseSquare(std::string_view name); //!< "e4" -> 28.

std::string toUci(const Move& move);                         //!< "e2e4", "e7e8q".
std::optional<Move> moveFromUci(std::string_view uci);       //!< Parse UCI notation. No legality check.
std::optional<PieceType> promotionFromChar(char c);          //!< 'q','r','b','n'.

//! Serialize an action to its compact history notation. "b:e2e4" for a ban, "m:e7e8q" for a move.
std::string serializeAction(const Action& action);
//! Parse "b:..." / "m:..." notation. Returns empty on malformed input.
std::optional<Action> deserializeAction(std::string_view text);

} // namespace banchess::rules
