#include "moveGenerator.hpp"

#include <array>
#include <cstdlib>
#include <initializer_list>
#include <utility>

namespace banchess::rules {

using Delta = std::pair<int, int>; //!< File, rank offset.

static constexpr std::array<Delta, 8> KNIGHT_DELTAS{{{1, 2}, {2, 1}, {-1, 2}, {-2, 1}, {1, -2}, {2, -1}, {-1, -2}, {-2, -1}}};
static constexpr std::array<Delta, 8> KING_DELTAS{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}, {1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};
static constexpr std::array<Delta, 4> BISHOP_DIRS{{{1, 1}, {1, -1}, {-1, 1}, {-1, -1}}};
static constexpr std::array<Delta, 4> ROOK_DIRS{{{1, 0}, {-1, 0}, {0, 1}, {0, -1}}};

static constexpr std::array<PieceType, 4> PROMOTIONS{PieceType::Queen, PieceType::Rook, PieceType::Bishop, PieceType::Knight};

static constexpr bool onBoard(int file, int rank) {
	return file >= 0 && file < 8 && rank >= 0 && rank < 8;
}

static constexpr int pawnDirection(Color color) {
	return color == Color::White ? 1 : -1;
}

static bool isPiece(const Position& pos, int file, int rank, PieceType type, Color color) {
	if (!onBoard(file, rank)) {
		return false;
	}
	const auto piece = pos.at(makeSquare(file, rank));
	return piece.type == type && piece.color == color;
}

//! First piece along a ray starting next to the square. Empty piece if the ray leaves the board.
static Piece firstOnRay(const Position& pos, Square from, Delta dir) {
	int file = fileOf(from) + dir.first;
	int rank = rankOf(from) + dir.second;
	while (onBoard(file, rank)) {
		const auto piece = pos.at(makeSquare(file, rank));
		if (piece.type != PieceType::None) {
			return piece;
		}
		file += dir.first;
		rank += dir.second;
	}
	return {};
}

bool isSquareAttacked(const Position& pos, Square sq, Color by) {
	const int file = fileOf(sq);
	const int rank = rankOf(sq);

	// Pawns attack diagonally forward, so look one rank behind the target from the attackers view.
	const int pawnRank = rank - pawnDirection(by);
	if (isPiece(pos, file - 1, pawnRank, PieceType::Pawn, by) || isPiece(pos, file + 1, pawnRank, PieceType::Pawn, by)) {
		return true;
	}

	for (const auto& [df, dr]: KNIGHT_DELTAS) {
		if (isPiece(pos, file + df, rank + dr, PieceType::Knight, by)) {
			return true;
		}
	}
	for (const auto& [df, dr]: KING_DELTAS) {
		if (isPiece(pos, file + df, rank + dr, PieceType::King, by)) {
			return true;
		}
	}

	for (const auto& dir: BISHOP_DIRS) {
		const auto piece = firstOnRay(pos, sq, dir);
		if (piece.color == by && (piece.type == PieceType::Bishop || piece.type == PieceType::Queen)) {
			return true;
		}
	}
	for (const auto& dir: ROOK_DIRS) {
		const auto piece = firstOnRay(pos, sq, dir);
		if (piece.color == by && (piece.type == PieceType::Rook || piece.type == PieceType::Queen)) {
			return true;
		}
	}

	return false;
}

Square findKing(const Position& pos, Color color) {
	for (Square sq = 0; sq < NO_SQUARE; ++sq) {
		const auto piece = pos.at(sq);
		if (piece.type == PieceType::King && piece.color == color) {
			return sq;
		}
	}
	return NO_SQUARE;
}

bool isKingAttacked(const Position& pos, Color color) {
	const auto king = findKing(pos, color);
	return king != NO_SQUARE && isSquareAttacked(pos, king, opponent(color));
}

static void addPawnMove(std::vector<Move>& moves, Square from, Square to, Color color) {
	const int lastRank = color == Color::White ? 7 : 0;
	if (rankOf(to) == lastRank) {
		for (const auto promotion: PROMOTIONS) {
			moves.push_back(Move{.from = from, .to = to, .promotion = promotion});
		}
		return;
	}
	moves.push_back(Move{.from = from, .to = to});
}

static void generatePawnMoves(const Position& pos, Square from, std::vector<Move>& moves) {
	const auto color   = pos.sideToMove;
	const int dir      = pawnDirection(color);
	const int file     = fileOf(from);
	const int rank     = rankOf(from);
	const int homeRank = color == Color::White ? 1 : 6;

	if (onBoard(file, rank + dir) && pos.at(makeSquare(file, rank + dir)).type == PieceType::None) {
		addPawnMove(moves, from, makeSquare(file, rank + dir), color);

		if (rank == homeRank && pos.at(makeSquare(file, rank + 2 * dir)).type == PieceType::None) {
			moves.push_back(Move{.from = from, .to = makeSquare(file, rank + 2 * dir)});
		}
	}

	for (const int df: {-1, 1}) {
		if (!onBoard(file + df, rank + dir)) {
			continue;
		}
		const auto to     = makeSquare(file + df, rank + dir);
		const auto target = pos.at(to);
		if (target.type != PieceType::None && target.color != color) {
			addPawnMove(moves, from, to, color);
		} else if (target.type == PieceType::None && to == pos.enPassant) {
			moves.push_back(Move{.from = from, .to = to});
		}
	}
}

template <std::size_t N>
static void generateStepMoves(const Position& pos, Square from, const std::array<Delta, N>& deltas, std::vector<Move>& moves) {
	for (const auto& [df, dr]: deltas) {
		const int file = fileOf(from) + df;
		const int rank = rankOf(from) + dr;
		if (!onBoard(file, rank)) {
			continue;
		}
		const auto to     = makeSquare(file, rank);
		const auto target = pos.at(to);
		if (target.type == PieceType::None || target.color != pos.sideToMove) {
			moves.push_back(Move{.from = from, .to = to});
		}
	}
}

static void generateSlidingMoves(const Position& pos, Square from, const std::array<Delta, 4>& dirs, std::vector<Move>& moves) {
	for (const auto& [df, dr]: dirs) {
		int file = fileOf(from) + df;
		int rank = rankOf(from) + dr;
		while (onBoard(file, rank)) {
			const auto to     = makeSquare(file, rank);
			const auto target = pos.at(to);
			if (target.type == PieceType::None) {
				moves.push_back(Move{.from = from, .to = to});
			} else {
				if (target.color != pos.sideToMove) {
					moves.push_back(Move{.from = from, .to = to});
				}
				break;
			}
			file += df;
			rank += dr;
		}
	}
}

static bool squaresEmpty(const Position& pos, std::initializer_list<Square> squares) {
	for (const auto sq: squares) {
		if (pos.at(sq).type != PieceType::None) {
			return false;
		}
	}
	return true;
}

static bool squaresSafe(const Position& pos, std::initializer_list<Square> squares, Color by) {
	for (const auto sq: squares) {
		if (isSquareAttacked(pos, sq, by)) {
			return false;
		}
	}
	return true;
}

static void generateCastling(const Position& pos, std::vector<Move>& moves) {
	const auto color = pos.sideToMove;
	const auto enemy = opponent(color);
	const int rank   = color == Color::White ? 0 : 7;

	const auto shortRight = color == Color::White ? CASTLE_WHITE_SHORT : CASTLE_BLACK_SHORT;
	const auto longRight  = color == Color::White ? CASTLE_WHITE_LONG : CASTLE_BLACK_LONG;

	const auto king = makeSquare(4, rank);
	if (pos.at(king) != Piece{PieceType::King, color}) {
		return;
	}

	const Piece rook{PieceType::Rook, color};
	if ((pos.castling & shortRight) && pos.at(makeSquare(7, rank)) == rook && squaresEmpty(pos, {makeSquare(5, rank), makeSquare(6, rank)}) &&
	    squaresSafe(pos, {king, makeSquare(5, rank), makeSquare(6, rank)}, enemy)) {
		moves.push_back(Move{.from = king, .to = makeSquare(6, rank)});
	}
	if ((pos.castling & longRight) && pos.at(makeSquare(0, rank)) == rook &&
	    squaresEmpty(pos, {makeSquare(1, rank), makeSquare(2, rank), makeSquare(3, rank)}) &&
	    squaresSafe(pos, {king, makeSquare(3, rank), makeSquare(2, rank)}, enemy)) {
		moves.push_back(Move{.from = king, .to = makeSquare(2, rank)});
	}
}

std::vector<Move> pseudoLegalMoves(const Position& pos) {
	std::vector<Move> moves;
	moves.reserve(64);

	for (Square from = 0; from < NO_SQUARE; ++from) {
		const auto piece = pos.at(from);
		if (piece.type == PieceType::None || piece.color != pos.sideToMove) {
			continue;
		}

		switch (piece.type) {
		case PieceType::Pawn:
			generatePawnMoves(pos, from, moves);
			break;
		case PieceType::Knight:
			generateStepMoves(pos, from, KNIGHT_DELTAS, moves);
			break;
		case PieceType::Bishop:
			generateSlidingMoves(pos, from, BISHOP_DIRS, moves);
			break;
		case PieceType::Rook:
			generateSlidingMoves(pos, from, ROOK_DIRS, moves);
			break;
		case PieceType::Queen:
			generateSlidingMoves(pos, from, BISHOP_DIRS, moves);
			generateSlidingMoves(pos, from, ROOK_DIRS, moves);
			break;
		case PieceType::King:
			generateStepMoves(pos, from, KING_DELTAS, moves);
			break;
		case PieceType::None:
			break;
		}
	}

	generateCastling(pos, moves);
	return moves;
}

//! Clear castling rights touched by a move from or to the given square.
static std::uint8_t castlingMask(Square sq) {
	switch (sq) {
	case makeSquare(4, 0):
		return CASTLE_WHITE_SHORT | CASTLE_WHITE_LONG;
	case makeSquare(7, 0):
		return CASTLE_WHITE_SHORT;
	case makeSquare(0, 0):
		return CASTLE_WHITE_LONG;
	case makeSquare(4, 7):
		return CASTLE_BLACK_SHORT | CASTLE_BLACK_LONG;
	case makeSquare(7, 7):
		return CASTLE_BLACK_SHORT;
	case makeSquare(0, 7):
		return CASTLE_BLACK_LONG;
	default:
		return CASTLE_NONE;
	}
}

Position makeMove(const Position& pos, const Move& move) {
	Position next = pos;

	const auto piece    = pos.at(move.from);
	const auto captured = pos.at(move.to);
	const bool isPawn   = piece.type == PieceType::Pawn;

	next.board[move.from] = Piece{};
	next.board[move.to]   = piece;

	// En passant removes the pawn behind the target square.
	bool enPassantCapture = false;
	if (isPawn && move.to == pos.enPassant && captured.type == PieceType::None && fileOf(move.from) != fileOf(move.to)) {
		next.board[makeSquare(fileOf(move.to), rankOf(move.from))] = Piece{};
		enPassantCapture                                           = true;
	}

	const int lastRank = piece.color == Color::White ? 7 : 0;
	if (isPawn && rankOf(move.to) == lastRank) {
		const auto promotion     = move.promotion == PieceType::None ? PieceType::Queen : move.promotion;
		next.board[move.to].type = promotion;
	}

	// Castling moves the king two files; bring the rook along.
	if (piece.type == PieceType::King && std::abs(fileOf(move.to) - fileOf(move.from)) == 2) {
		const int rank       = rankOf(move.from);
		const bool kingside  = fileOf(move.to) == 6;
		const auto rookFrom  = makeSquare(kingside ? 7 : 0, rank);
		const auto rookTo    = makeSquare(kingside ? 5 : 3, rank);
		next.board[rookTo]   = next.board[rookFrom];
		next.board[rookFrom] = Piece{};
	}

	next.castling &= static_cast<std::uint8_t>(~(castlingMask(move.from) | castlingMask(move.to)));

	next.enPassant = NO_SQUARE;
	if (isPawn && std::abs(rankOf(move.to) - rankOf(move.from)) == 2) {
		next.enPassant = makeSquare(fileOf(move.from), (rankOf(move.from) + rankOf(move.to)) / 2);
	}

	if (isPawn || captured.type != PieceType::None || enPassantCapture) {
		next.halfmoveClock = 0;
	} else {
		++next.halfmoveClock;
	}
	if (pos.sideToMove == Color::Black) {
		++next.fullmoveNumber;
	}
	next.sideToMove = opponent(pos.sideToMove);

	return next;
}

std::vector<Move> legalMoves(const Position& pos) {
	std::vector<Move> legal;
	for (const auto& move: pseudoLegalMoves(pos)) {
		if (!isKingAttacked(makeMove(pos, move), pos.sideToMove)) {
			legal.push_back(move);
		}
	}
	return legal;
}

} // namespace banchess::rules
