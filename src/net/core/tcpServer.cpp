#include "network/core/tcpServer.hpp"
#include "connection.hpp"
#include "logging.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>

namespace banchess::network::core {

class TcpServer::Implementation {
public:
	explicit Implementation(Options options);

	bool start();
	void connect(Callbacks callbacks);
	void stop();

	std::uint16_t port() const;

	bool send(ConnectionId connectionId, const Message& msg);
	void close(ConnectionId connectionId);

private:
	bool openAcceptor(); //!< Open/bind/listen in error_code land.
	void doAccept();     //!< Start async accept loop.
	std::shared_ptr<Connection> createConnection(asio::ip::tcp::socket socket);

private:
	Options m_options;

	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;
	std::atomic<std::uint16_t> m_boundPort{0};

	std::thread m_ioThread;             //!< IO context thread.
	std::atomic<bool> m_running{false}; //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	ConnectionId m_nextConnectionId{1};
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	std::mutex m_connectionsMutex;                                               //!< Handle concurrency.
};


TcpServer::Implementation::Implementation(Options options) : m_options(options), m_acceptor(m_ioContext) {
}

bool TcpServer::Implementation::openAcceptor() {
	asio::error_code ec;
	m_acceptor.open(asio::ip::tcp::v4(), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not open acceptor: {}", ec.message()));
		return false;
	}
	m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	m_acceptor.bind(asio::ip::tcp::endpoint(asio::ip::tcp::v4(), m_options.port), ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not bind port {}: {}", m_options.port, ec.message()));
		m_acceptor.close(ec);
		return false;
	}
	m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not listen: {}", ec.message()));
		m_acceptor.close(ec);
		return false;
	}

	m_boundPort = m_acceptor.local_endpoint(ec).port();
	return !ec;
}

bool TcpServer::Implementation::start() {
	if (m_running.exchange(true)) {
		return true;
	}
	if (!openAcceptor()) {
		m_running = false;
		return false;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();
	m_ioThread = std::thread([this]() { m_ioContext.run(); });

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on port {}.", m_boundPort.load()));
	return true;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	m_ioContext.stop();
	if (m_ioThread.joinable()) {
		m_ioThread.join();
	}

	// IO thread is gone. Close sockets directly, server shutdown does not signal disconnects.
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->shutdown();
	}

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

std::uint16_t TcpServer::Implementation::port() const {
	return m_boundPort;
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	if (const auto it = m_connections.find(connectionId); it != m_connections.end()) {
		return it->second->send(msg);
	}
	return false;
}

void TcpServer::Implementation::close(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	if (const auto it = m_connections.find(connectionId); it != m_connections.end()) {
		it->second->stop();
	}
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			if (auto connection = createConnection(std::move(socket))) {
				connection->start();
			}
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

std::shared_ptr<Connection> TcpServer::Implementation::createConnection(asio::ip::tcp::socket socket) {
	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
		if (m_callbacks.onConnect) {
			m_callbacks.onConnect(connection.connectionId());
		}
	};
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto connectionId = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(connectionId);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(connectionId);
		}
	};

	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	const auto connectionId = m_nextConnectionId++;
	const Connection::Limits limits{.maxQueuedMessages = m_options.maxQueuedMessages, .idleTimeout = m_options.idleTimeout};

	auto connection = std::make_shared<Connection>(std::move(socket), connectionId, limits, std::move(callbacks));
	m_connections.emplace(connectionId, connection);
	return connection;
}


TcpServer::TcpServer(std::uint16_t port) : TcpServer(Options{.port = port}) {
}

TcpServer::TcpServer(Options options) : m_pimpl(std::make_unique<Implementation>(options)) {
}

TcpServer::~TcpServer() {
	stop();
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

void TcpServer::stop() {
	m_pimpl->stop();
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

void TcpServer::close(ConnectionId connectionId) {
	m_pimpl->close(connectionId);
}

} // namespace banchess::network::core
