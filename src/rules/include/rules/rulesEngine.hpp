#pragma once

#include "rules/position.hpp"
#include "rules/types.hpp"

#include <optional>
#include <vector>

namespace banchess::rules {

//! Actions available in a position. Bans and moves are never mixed.
struct LegalActions {
	ActionType type{ActionType::Ban}; //!< Kind of the pending action.
	Color actor{Color::Black};        //!< Color that has to act.
	std::vector<Move> actions;        //!< For bans: from/to pairs only. For moves: full moves incl. promotions.

	bool contains(const Move& move) const;
};

enum class Outcome {
	Ongoing,
	Checkmate,            //!< Side to move is checkmated.
	Stalemate,            //!< Side to move has no playable move and is not in check.
	InsufficientMaterial, //!< Neither side can mate.
	FiftyMoveRule,        //!< 100 plies without capture or pawn move.
};

//! Pure, stateless rules of a game. The session engine only talks to this interface.
class IRulesEngine {
public:
	virtual ~IRulesEngine() = default;

	virtual Position initialPosition() const                                         = 0;
	virtual LegalActions legalActions(const Position& pos) const                     = 0;
	virtual std::optional<Position> apply(const Position& pos, const Action& action) const = 0; //!< Empty if the action is not legal.
	virtual Outcome outcome(const Position& pos) const                               = 0;
	virtual bool inCheck(const Position& pos) const                                  = 0; //!< Side to move is in check.
};

} // namespace banchess::rules
