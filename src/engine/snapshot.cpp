#include "engine/snapshot.hpp"

namespace banchess::engine {

SessionView projectFor(const SessionState& state, Seat role) {
	SessionView view{
	        .sessionId     = state.id,
	        .mode          = state.mode,
	        .white         = state.participants.white,
	        .black         = state.participants.black,
	        .timeControl   = state.timeControl,
	        .role          = role,
	        .fen           = state.position.toFen(),
	        .history       = state.history,
	        .pending       = state.legal.type,
	        .actor         = state.legal.actor,
	        .legalActions  = {},
	        .inCheck       = state.inCheck,
	        .status        = state.status,
	        .result        = state.result,
	        .clock         = state.clock,
	        .drawOfferedBy = state.drawOfferedBy,
	        .version       = state.version,
	};

	if (state.status == SessionStatus::Active && hasColor(role, state.legal.actor)) {
		view.legalActions = state.legal.actions;
	}
	return view;
}

} // namespace banchess::engine
