#pragma once

#include "rules/rulesEngine.hpp"

namespace banchess::rules {

//! Chess with a ban before every move: the opponent of the side to move names one legal move
//! (from/to) that may not be played on the very next move.
//! Sequence from the start position: ban(Black), move(White), ban(White), move(Black), ...
class BanChessRules final : public IRulesEngine {
public:
	Position initialPosition() const override;
	LegalActions legalActions(const Position& pos) const override;
	std::optional<Position> apply(const Position& pos, const Action& action) const override;
	Outcome outcome(const Position& pos) const override;
	bool inCheck(const Position& pos) const override;
};

} // namespace banchess::rules
