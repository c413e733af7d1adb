#pragma once

#include "network/core/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>

namespace banchess::network::core {

//! Transportation primitive. Handles read/write from a single client connection.
//! \note Internals are async and run on the server IO thread.
//!       We use shared_from_this() so any in-flight async op keeps the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	struct Limits {
		std::size_t maxQueuedMessages;        //!< Outbound backlog before the connection is dropped.
		std::chrono::milliseconds idleTimeout; //!< Zero disables the idle check.
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Limits limits, Callbacks callbacks);
	~Connection();

	void start();                  //!< Start connection: triggers onConnect and begins async read loop.
	void stop();                   //!< Close on the strand. onDisconnect fires once.
	void shutdown();               //!< Close the socket without signalling. Only call when the IO thread is not running.
	bool send(const Message& msg); //!< Queue message for the client. Safe to call from any thread. An oversized message closes the connection and returns false.

	ConnectionId connectionId() const; //!< Get the identifier of this connection.

private:
	void startRead();    //!< Prime async read and dispatch messages.
	void startWrite();   //!< Prime async write for new messages.
	void armIdleTimer(); //!< Restart the idle countdown.
	void doDisconnect(); //!< Internal cleanup.

private:
	std::atomic<bool> m_running{false};           //!< Connection accepting IO.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< IO with different threads.
	asio::steady_timer m_idleTimer;

	ConnectionId m_connectionId; //!< Unique identifier on the network layer.
	Limits m_limits;
	Callbacks m_callbacks; //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue;
	bool m_writeInProgress{false};
};

} // namespace banchess::network::core
