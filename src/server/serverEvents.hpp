#pragma once

#include "engine/session.hpp"
#include "engine/types.hpp"
#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>

namespace banchess::server {

// Events flowing from transport, session worker and timer threads into the multiplexer thread.
// Keep these small so callbacks on foreign threads remain cheap.
enum class ServerEventType { ClientConnected, ClientDisconnected, ClientMessage, SessionUpdated, ActionRejected, SessionRemoved, GraceExpired, Shutdown };

struct ServerEvent {
	ServerEventType type{};
	network::core::ConnectionId connectionId{}; //!< Network connection id. Origin of a rejected action.
	network::core::Message payload{};           //!< Network message. Protocol examples: {"type":"attach","sessionId":"..."}, {"type":"ping"}.

	engine::SessionId sessionId{};
	std::shared_ptr<const engine::SessionState> state{}; //!< Set for SessionUpdated.
	engine::ErrorCode code{engine::ErrorCode::None};     //!< Set for ActionRejected.
	engine::Seat seat{engine::Seat::None};               //!< Seat of an expired grace window.
	std::uint64_t token{0};                              //!< Grace windows that were cancelled meanwhile have another token.
};

} // namespace banchess::server
