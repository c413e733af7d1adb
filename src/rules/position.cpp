#include "rules/position.hpp"

#include <cctype>
#include <charconv>
#include <format>
#include <vector>

namespace banchess::rules {

static std::vector<std::string_view> splitFields(std::string_view text) {
	std::vector<std::string_view> fields;
	std::size_t start = 0;
	while (start < text.size()) {
		const auto end = text.find(' ', start);
		const auto len = (end == std::string_view::npos ? text.size() : end) - start;
		if (len > 0) {
			fields.push_back(text.substr(start, len));
		}
		if (end == std::string_view::npos) {
			break;
		}
		start = end + 1;
	}
	return fields;
}

static std::optional<Piece> pieceFromChar(char c) {
	const auto color = std::isupper(static_cast<unsigned char>(c)) ? Color::White : Color::Black;
	switch (std::tolower(static_cast<unsigned char>(c))) {
	case 'p':
		return Piece{PieceType::Pawn, color};
	case 'n':
		return Piece{PieceType::Knight, color};
	case 'b':
		return Piece{PieceType::Bishop, color};
	case 'r':
		return Piece{PieceType::Rook, color};
	case 'q':
		return Piece{PieceType::Queen, color};
	case 'k':
		return Piece{PieceType::King, color};
	default:
		return {};
	}
}

static char pieceChar(Piece piece) {
	char c = '?';
	switch (piece.type) {
	case PieceType::Pawn:
		c = 'p';
		break;
	case PieceType::Knight:
		c = 'n';
		break;
	case PieceType::Bishop:
		c = 'b';
		break;
	case PieceType::Rook:
		c = 'r';
		break;
	case PieceType::Queen:
		c = 'q';
		break;
	case PieceType::King:
		c = 'k';
		break;
	case PieceType::None:
		break;
	}
	return piece.color == Color::White ? static_cast<char>(std::toupper(c)) : c;
}

static bool parseUnsigned(std::string_view value, unsigned& out) {
	if (value.empty()) {
		return false;
	}
	const auto [ptr, ec] = std::from_chars(value.data(), value.data() + value.size(), out);
	return ec == std::errc() && ptr == value.data() + value.size();
}

Position Position::initial() {
	// START_FEN is a compile time constant and always valid.
	return *fromFen(START_FEN);
}

std::optional<Position> Position::fromFen(std::string_view fen) {
	const auto fields = splitFields(fen);
	if (fields.size() < 4 || fields.size() > 7) {
		return {};
	}

	Position pos;
	pos.board.fill(Piece{});

	// Placement. Ranks are listed from 8 to 1.
	int rank = 7;
	int file = 0;
	int whiteKings = 0;
	int blackKings = 0;
	for (const char c: fields[0]) {
		if (c == '/') {
			if (file != 8 || rank == 0) {
				return {};
			}
			--rank;
			file = 0;
			continue;
		}
		if (c >= '1' && c <= '8') {
			file += c - '0';
			if (file > 8) {
				return {};
			}
			continue;
		}
		const auto piece = pieceFromChar(c);
		if (!piece || file > 7) {
			return {};
		}
		if (piece->type == PieceType::King) {
			++(piece->color == Color::White ? whiteKings : blackKings);
		}
		pos.board[makeSquare(file, rank)] = *piece;
		++file;
	}
	if (rank != 0 || file != 8 || whiteKings != 1 || blackKings != 1) {
		return {};
	}

	if (fields[1] == "w") {
		pos.sideToMove = Color::White;
	} else if (fields[1] == "b") {
		pos.sideToMove = Color::Black;
	} else {
		return {};
	}

	pos.castling = CASTLE_NONE;
	if (fields[2] != "-") {
		for (const char c: fields[2]) {
			switch (c) {
			case 'K':
				pos.castling |= CASTLE_WHITE_SHORT;
				break;
			case 'Q':
				pos.castling |= CASTLE_WHITE_LONG;
				break;
			case 'k':
				pos.castling |= CASTLE_BLACK_SHORT;
				break;
			case 'q':
				pos.castling |= CASTLE_BLACK_LONG;
				break;
			default:
				return {};
			}
		}
	}

	if (fields[3] == "-") {
		pos.enPassant = NO_SQUARE;
	} else {
		const auto ep = parseSquare(fields[3]);
		if (!ep) {
			return {};
		}
		pos.enPassant = *ep;
	}

	if (fields.size() >= 5 && !parseUnsigned(fields[4], pos.halfmoveClock)) {
		return {};
	}
	if (fields.size() >= 6 && (!parseUnsigned(fields[5], pos.fullmoveNumber) || pos.fullmoveNumber == 0)) {
		return {};
	}

	pos.pending    = ActionType::Ban;
	pos.bannedMove = std::nullopt;
	if (fields.size() == 7) {
		const auto banField = fields[6];
		if (banField == "ban") {
			pos.pending = ActionType::Ban;
		} else if (banField == "move") {
			pos.pending = ActionType::Move;
		} else if (banField.starts_with("move:")) {
			const auto banned = moveFromUci(banField.substr(5));
			if (!banned) {
				return {};
			}
			pos.pending    = ActionType::Move;
			pos.bannedMove = Move{.from = banned->from, .to = banned->to};
		} else {
			return {};
		}
	}

	return pos;
}

std::string Position::toFen() const {
	std::string placement;
	for (int rank = 7; rank >= 0; --rank) {
		int empty = 0;
		for (int file = 0; file < 8; ++file) {
			const auto piece = board[makeSquare(file, rank)];
			if (piece.type == PieceType::None) {
				++empty;
				continue;
			}
			if (empty) {
				placement.push_back(static_cast<char>('0' + empty));
				empty = 0;
			}
			placement.push_back(pieceChar(piece));
		}
		if (empty) {
			placement.push_back(static_cast<char>('0' + empty));
		}
		if (rank) {
			placement.push_back('/');
		}
	}

	std::string rights;
	if (castling & CASTLE_WHITE_SHORT) {
		rights.push_back('K');
	}
	if (castling & CASTLE_WHITE_LONG) {
		rights.push_back('Q');
	}
	if (castling & CASTLE_BLACK_SHORT) {
		rights.push_back('k');
	}
	if (castling & CASTLE_BLACK_LONG) {
		rights.push_back('q');
	}
	if (rights.empty()) {
		rights = "-";
	}

	std::string banField = "ban";
	if (pending == ActionType::Move) {
		banField = bannedMove ? "move:" + squareName(bannedMove->from) + squareName(bannedMove->to) : "move";
	}

	return std::format("{} {} {} {} {} {} {}", placement, sideToMove == Color::White ? "w" : "b", rights, squareName(enPassant), halfmoveClock,
	                   fullmoveNumber, banField);
}

} // namespace banchess::rules
