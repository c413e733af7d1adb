#pragma once

#include "engine/types.hpp"
#include "network/core/protocol.hpp"

#include <cstdint>
#include <optional>
#include <unordered_map>
#include <vector>

namespace banchess::server {

using network::core::ConnectionId;

struct ConnectionContext {
	ConnectionId connectionId;                      //!< Identify connection on network layer.
	std::optional<engine::Identity> identity;       //!< Set after authentication.
	std::optional<engine::SessionId> attachedTo;    //!< At most one session per connection.
	engine::Seat seat{engine::Seat::None};          //!< Role in the attached session.
	std::optional<std::uint64_t> lastVersion;       //!< Last state version sent for the attached session.
};

//! Connection bookkeeping of the multiplexer.
//! \note Used from the multiplexer thread only.
class ConnectionManager {
public:
	bool add(ConnectionId connectionId); //!< Register a new connection. Returns false if known.
	void remove(ConnectionId connectionId);

	ConnectionContext* find(ConnectionId connectionId);

	std::vector<ConnectionId> attachedTo(const engine::SessionId& sessionId) const;
	std::vector<ConnectionId> connectionsOf(const engine::UserId& userId) const;

	//! True if another connection is attached to the session with a seat overlapping the given one.
	bool seatTaken(const engine::SessionId& sessionId, engine::Seat seat, ConnectionId except) const;

	std::size_t size() const;

private:
	std::unordered_map<ConnectionId, ConnectionContext> m_connections;
};

} // namespace banchess::server
