#pragma once

#include "engine/snapshot.hpp"
#include "engine/types.hpp"
#include "rules/types.hpp"

#include <optional>
#include <string>
#include <variant>
#include <vector>

namespace banchess::network {

//! Requested time control. Empty: server default. Inner empty: untimed.
using TimeControlRequest = std::optional<std::optional<engine::TimeControl>>;

// Client Network Events (client -> server)
struct ClientAuthenticate {
	std::string userId;
	std::string username;
	std::string token; //!< Optional shared secret.
};
struct ClientCreateSolo {
	TimeControlRequest timeControl;
};
struct ClientJoinQueue {
	TimeControlRequest timeControl;
};
struct ClientLeaveQueue {};
struct ClientAttach {
	engine::SessionId sessionId;
};
struct ClientDetach {};
struct ClientAction {
	engine::SessionId sessionId;
	rules::Action action; //!< {"ban":{"from","to"}} or {"move":{"from","to","promotion"}} on the wire.
};
struct ClientResign {
	engine::SessionId sessionId;
};
struct ClientOfferDraw {
	engine::SessionId sessionId;
};
struct ClientAcceptDraw {
	engine::SessionId sessionId;
};
struct ClientGiveTime {
	engine::SessionId sessionId;
	std::optional<unsigned> seconds; //!< Server default if empty.
};
struct ClientPing {};

// Server Events (server -> client)
struct ServerAuthenticated {
	engine::Identity identity;
	std::vector<engine::SessionId> activeSessions; //!< Unfinished games of this identity.
};
struct ServerGameCreated {
	engine::SessionId sessionId;
	std::optional<engine::TimeControl> timeControl;
};
struct ServerQueuePosition {
	std::size_t position; //!< 1-based position in the preference class.
};
struct ServerMatched {
	engine::SessionId sessionId;
	rules::Color color; //!< Color of the receiver.
	engine::Identity opponent;
};
enum class QueueLeftResult : std::uint8_t { Left, AlreadyMatched };
struct ServerQueueLeft {
	QueueLeftResult result;
	std::optional<engine::SessionId> sessionId; //!< Set for AlreadyMatched.
};
struct ServerDetached {
	engine::SessionId sessionId;
};
struct ServerState {
	engine::SessionView view; //!< Full snapshot for the receiver's role.
};
struct ServerError {
	engine::ErrorCode code;
	std::string message;
};
struct ServerPong {};


using ClientEvent = std::variant<ClientAuthenticate, ClientCreateSolo, ClientJoinQueue, ClientLeaveQueue, ClientAttach, ClientDetach, ClientAction,
                                 ClientResign, ClientOfferDraw, ClientAcceptDraw, ClientGiveTime, ClientPing>;
using ServerEvent = std::variant<ServerAuthenticated, ServerGameCreated, ServerQueuePosition, ServerMatched, ServerQueueLeft, ServerDetached,
                                 ServerState, ServerError, ServerPong>;

// Serialize typed events to JSON messages.
std::string toMessage(const ClientEvent& event);
std::string toMessage(const ServerEvent& event);

// Parse JSON messages into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(const std::string& message);
std::optional<ServerEvent> fromServerMessage(const std::string& message);

std::string toString(engine::Seat seat); //!< "white", "black", "both", "spectator" or "none".

} // namespace banchess::network
