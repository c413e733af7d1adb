#pragma once

#include "network/core/protocol.hpp"
#include "network/core/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>

namespace banchess::network::core {

//! Connection manager that runs an async accept loop on a dedicated IO thread.
//! \note    This is a thin wrapper: all heavy lifting is in Connection (async read/write).
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer final : public ITransport {
public:
	struct Callbacks {
		std::function<void(const ConnectionId&)> onConnect;
		std::function<void(const ConnectionId&, const Message&)> onMessage;
		std::function<void(const ConnectionId&)> onDisconnect;
	};

	struct Options {
		std::uint16_t port{DEFAULT_PORT};                         //!< 0 picks a free port.
		std::size_t maxQueuedMessages{DEFAULT_MAX_QUEUED_MESSAGES}; //!< Overflow closes the connection.
		std::chrono::milliseconds idleTimeout{DEFAULT_IDLE_TIMEOUT}; //!< Zero disables the idle check.
	};

	explicit TcpServer(std::uint16_t port = DEFAULT_PORT);
	explicit TcpServer(Options options);
	~TcpServer() override;

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the port could not be bound.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	std::uint16_t port() const; //!< Bound port. Useful with port 0.

	bool send(ConnectionId connectionId, const Message& msg) override; //!< Send message to the client with given connectionId. Returns false if not found or oversized.
	void close(ConnectionId connectionId) override;                    //!< Force close connection.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace banchess::network::core
