#pragma once

#include "network/core/protocol.hpp"

namespace banchess::network::core {

//! Outbound side of a message transport.
class ITransport {
public:
	virtual ~ITransport() = default;

	virtual bool send(ConnectionId connectionId, const Message& message) = 0; //!< Queue a message. Returns false if the connection is unknown or the message can not be sent.
	virtual void close(ConnectionId connectionId)                        = 0; //!< Force close. The disconnect callback still fires.
};

} // namespace banchess::network::core
