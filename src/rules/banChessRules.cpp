#include "rules/banChessRules.hpp"
#include "moveGenerator.hpp"

#include <algorithm>

namespace banchess::rules {

static constexpr unsigned FIFTY_MOVE_PLIES = 100;

//! One entry per from/to pair; promotion variants collapse into one ban.
static std::vector<Move> uniqueSquares(const std::vector<Move>& moves) {
	std::vector<Move> unique;
	unique.reserve(moves.size());
	for (const auto& move: moves) {
		if (std::ranges::none_of(unique, [&](const Move& m) { return m.sameSquares(move); })) {
			unique.push_back(Move{.from = move.from, .to = move.to});
		}
	}
	return unique;
}

static bool insufficientMaterial(const Position& pos) {
	int minors = 0;
	for (const auto& piece: pos.board) {
		switch (piece.type) {
		case PieceType::None:
		case PieceType::King:
			break;
		case PieceType::Knight:
		case PieceType::Bishop:
			++minors;
			break;
		default:
			return false;
		}
	}
	return minors <= 1;
}

Position BanChessRules::initialPosition() const {
	return Position::initial();
}

LegalActions BanChessRules::legalActions(const Position& pos) const {
	const auto moves = legalMoves(pos);

	if (pos.pending == ActionType::Ban) {
		return LegalActions{.type = ActionType::Ban, .actor = opponent(pos.sideToMove), .actions = uniqueSquares(moves)};
	}

	LegalActions legal{.type = ActionType::Move, .actor = pos.sideToMove, .actions = {}};
	for (const auto& move: moves) {
		if (pos.bannedMove && pos.bannedMove->sameSquares(move)) {
			continue;
		}
		legal.actions.push_back(move);
	}
	return legal;
}

std::optional<Position> BanChessRules::apply(const Position& pos, const Action& action) const {
	if (action.type != pos.pending) {
		return {};
	}

	const auto legal = legalActions(pos);

	if (action.type == ActionType::Ban) {
		if (!legal.contains(action.move)) {
			return {};
		}
		Position next   = pos;
		next.pending    = ActionType::Move;
		next.bannedMove = Move{.from = action.move.from, .to = action.move.to};
		return next;
	}

	auto move = action.move;
	if (move.from >= NO_SQUARE || move.to >= NO_SQUARE) {
		return {};
	}

	// Pawn reaching the last rank without a piece given becomes a queen.
	const auto piece   = pos.at(move.from);
	const int lastRank = pos.sideToMove == Color::White ? 7 : 0;
	if (piece.type == PieceType::Pawn && rankOf(move.to) == lastRank && move.promotion == PieceType::None) {
		move.promotion = PieceType::Queen;
	}

	if (!legal.contains(move)) {
		return {};
	}

	auto next       = makeMove(pos, move);
	next.pending    = ActionType::Ban;
	next.bannedMove = std::nullopt;
	return next;
}

Outcome BanChessRules::outcome(const Position& pos) const {
	const auto legal = legalActions(pos);

	// Before a ban a single remaining move is always banned, so it counts as none.
	const std::size_t playable = pos.pending == ActionType::Ban ? (legal.actions.size() > 1 ? legal.actions.size() : 0) : legal.actions.size();
	if (playable == 0) {
		return inCheck(pos) ? Outcome::Checkmate : Outcome::Stalemate;
	}

	if (insufficientMaterial(pos)) {
		return Outcome::InsufficientMaterial;
	}

	if (pos.halfmoveClock >= FIFTY_MOVE_PLIES) {
		return Outcome::FiftyMoveRule;
	}

	return Outcome::Ongoing;
}

bool BanChessRules::inCheck(const Position& pos) const {
	return isKingAttacked(pos, pos.sideToMove);
}

} // namespace banchess::rules
