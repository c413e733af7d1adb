#include "rules/types.hpp"

namespace banchess::rules {

static constexpr std::string_view BAN_PREFIX  = "b:";
static constexpr std::string_view MOVE_PREFIX = "m:";

std::string toString(Color color) {
	return color == Color::White ? "white" : "black";
}

std::optional<Color> colorFromString(std::string_view s) {
	if (s == "white") {
		return Color::White;
	}
	if (s == "black") {
		return Color::Black;
	}
	return {};
}

std::string toString(ActionType type) {
	return type == ActionType::Ban ? "ban" : "move";
}

std::string squareName(Square sq) {
	if (sq >= NO_SQUARE) {
		return "-";
	}
	return {static_cast<char>('a' + fileOf(sq)), static_cast<char>('1' + rankOf(sq))};
}

std::optional<Square> parseSquare(std::string_view name) {
	if (name.size() != 2) {
		return {};
	}
	const int file = name[0] - 'a';
	const int rank = name[1] - '1';
	if (file < 0 || file > 7 || rank < 0 || rank > 7) {
		return {};
	}
	return makeSquare(file, rank);
}

std::optional<PieceType> promotionFromChar(char c) {
	switch (c) {
	case 'q':
		return PieceType::Queen;
	case 'r':
		return PieceType::Rook;
	case 'b':
		return PieceType::Bishop;
	case 'n':
		return PieceType::Knight;
	default:
		return {};
	}
}

static char promotionChar(PieceType type) {
	switch (type) {
	case PieceType::Queen:
		return 'q';
	case PieceType::Rook:
		return 'r';
	case PieceType::Bishop:
		return 'b';
	case PieceType::Knight:
		return 'n';
	default:
		return '\0';
	}
}

std::string toUci(const Move& move) {
	auto text = squareName(move.from) + squareName(move.to);
	if (const auto c = promotionChar(move.promotion); c != '\0') {
		text.push_back(c);
	}
	return text;
}

std::optional<Move> moveFromUci(std::string_view uci) {
	if (uci.size() != 4 && uci.size() != 5) {
		return {};
	}
	const auto from = parseSquare(uci.substr(0, 2));
	const auto to   = parseSquare(uci.substr(2, 2));
	if (!from || !to || *from == *to) {
		return {};
	}

	Move move{.from = *from, .to = *to};
	if (uci.size() == 5) {
		const auto promotion = promotionFromChar(uci[4]);
		if (!promotion) {
			return {};
		}
		move.promotion = *promotion;
	}
	return move;
}

std::string serializeAction(const Action& action) {
	if (action.type == ActionType::Ban) {
		// Bans name squares only.
		return std::string{BAN_PREFIX} + squareName(action.move.from) + squareName(action.move.to);
	}
	return std::string{MOVE_PREFIX} + toUci(action.move);
}

std::optional<Action> deserializeAction(std::string_view text) {
	if (text.starts_with(BAN_PREFIX)) {
		const auto body = text.substr(BAN_PREFIX.size());
		if (body.size() != 4) {
			return {};
		}
		const auto move = moveFromUci(body);
		if (!move) {
			return {};
		}
		return Action{.type = ActionType::Ban, .move = *move};
	}

	if (text.starts_with(MOVE_PREFIX)) {
		const auto move = moveFromUci(text.substr(MOVE_PREFIX.size()));
		if (!move) {
			return {};
		}
		return Action{.type = ActionType::Move, .move = *move};
	}

	return {};
}

} // namespace banchess::rules
