#pragma once

#include "engine/session.hpp"
#include "engine/types.hpp"

#include <memory>

namespace banchess::engine {

//! Callback interface invoked on session worker threads.
//! \note Keep handlers lightweight: enqueue and return.
class ISessionObserver {
public:
	virtual ~ISessionObserver() = default;

	//! An accepted transition. States of one session arrive in version order.
	virtual void onSessionUpdated(const SessionId& sessionId, std::shared_ptr<const SessionState> state) = 0;

	//! A command was rejected. Origin is the connection that sent it, or NO_ORIGIN.
	virtual void onActionRejected(const SessionId& sessionId, OriginId origin, ErrorCode code) = 0;

	//! The registry dropped a retired session. Called on the timer thread.
	virtual void onSessionRemoved(const SessionId&) {
	}
};

} // namespace banchess::engine
