#pragma once

#include "engine/session.hpp"

#include <optional>
#include <string>
#include <vector>

namespace banchess::engine {

//! Self-sufficient view of a session for one role. A client renders it without any earlier message.
struct SessionView {
	SessionId sessionId;
	GameMode mode{GameMode::Online};
	Identity white;
	Identity black;
	std::optional<TimeControl> timeControl;

	Seat role{Seat::Observer};                 //!< Role of the receiver.
	std::string fen;                           //!< Extended FEN of the current position.
	std::vector<HistoryEntry> history;         //!< Full ban/move history for replay.
	rules::ActionType pending{rules::ActionType::Ban};
	rules::Color actor{rules::Color::Black};   //!< Color that acts next.
	std::vector<rules::Move> legalActions;     //!< Only filled when the receiver has to act.
	bool inCheck{false};
	SessionStatus status{SessionStatus::Waiting};
	std::optional<GameResult> result;
	std::optional<ClockState> clock;
	std::optional<rules::Color> drawOfferedBy;
	std::uint64_t version{0};

	bool operator==(const SessionView&) const = default;
};

//! Project a published state for a role. Legal actions are only shown to the seat that has to act.
SessionView projectFor(const SessionState& state, Seat role);

} // namespace banchess::engine
