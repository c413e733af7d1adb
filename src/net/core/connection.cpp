#include "connection.hpp"
#include "logging.hpp"

#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <format>
#include <memory>
#include <string>
#include <utility>

namespace banchess::network::core {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, Limits limits, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_idleTimer(m_strand), m_connectionId(connectionId),
      m_limits(limits), m_callbacks(std::move(callbacks)) {
}

Connection::~Connection() {
	asio::error_code ec;
	m_socket.close(ec);
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}

	asio::post(m_strand, [self = shared_from_this()] {
		if (self->m_callbacks.onConnect) {
			self->m_callbacks.onConnect(*self);
		}
		self->armIdleTimer();
		self->startRead();
	});
}

void Connection::stop() {
	asio::post(m_strand, [self = shared_from_this()] { self->doDisconnect(); });
}

void Connection::shutdown() {
	m_running = false;

	asio::error_code ec;
	m_idleTimer.cancel();
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
}

bool Connection::send(const Message& msg) {
	if (!m_running.load()) {
		return false;
	}
	if (msg.size() > MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Connection] Message of {} bytes exceeds the frame limit. Disconnecting {}.", msg.size(), m_connectionId));
		stop();
		return false;
	}

	asio::post(m_strand, [self = shared_from_this(), msg] {
		if (!self->m_running) {
			return;
		}
		if (self->m_writeQueue.size() >= self->m_limits.maxQueuedMessages) {
			Logger().Log(Logging::LogLevel::Warning, std::format("[Connection] Outbound queue of connection {} is full. Disconnecting.", self->m_connectionId));
			self->doDisconnect();
			return;
		}

		self->m_writeQueue.push_back(msg);
		if (!self->m_writeInProgress) {
			self->startWrite();
		}
	});
	return true;
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		m_writeInProgress = false;
		return;
	}

	m_writeInProgress = true;

	auto header          = std::make_shared<BasicMessageHeader>();
	header->payload_size = to_network_u32(static_cast<std::uint32_t>(m_writeQueue.front().size()));

	std::array<asio::const_buffer, 2> buffers = {asio::buffer(header.get(), sizeof(BasicMessageHeader)),
	                                             asio::buffer(m_writeQueue.front().data(), m_writeQueue.front().size())};

	asio::async_write(m_socket, buffers, asio::bind_executor(m_strand, [self = shared_from_this(), header](asio::error_code ec, std::size_t) {
		                  if (ec || !self->m_running) {
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  if (!self->m_writeQueue.empty()) {
			                  self->startWrite();
		                  } else {
			                  self->m_writeInProgress = false;
		                  }
	                  }));
}

void Connection::startRead() {
	auto header = std::make_shared<BasicMessageHeader>();

	asio::async_read(m_socket, asio::buffer(header.get(), sizeof(BasicMessageHeader)),
	                 asio::bind_executor(m_strand, [self = shared_from_this(), header](asio::error_code ec, std::size_t) {
		                 if (ec || !self->m_running) {
			                 self->doDisconnect();
			                 return;
		                 }
		                 self->armIdleTimer();

		                 const auto payloadSize = from_network_u32(header->payload_size);
		                 if (payloadSize > MAX_REQUEST_BYTES) {
			                 Logger().Log(Logging::LogLevel::Warning,
			                              std::format("[Connection] Connection {} announced {} bytes. Disconnecting.", self->m_connectionId, payloadSize));
			                 self->doDisconnect();
			                 return;
		                 }

		                 if (payloadSize == 0) {
			                 if (self->m_callbacks.onMessage) {
				                 self->m_callbacks.onMessage(*self, Message{});
			                 }
			                 self->startRead();
			                 return;
		                 }

		                 auto payload = std::make_shared<Message>(payloadSize, '\0');
		                 asio::async_read(self->m_socket, asio::buffer(payload->data(), payload->size()),
		                                  asio::bind_executor(self->m_strand, [self, payload](asio::error_code ec1, std::size_t) {
			                                  if (ec1 || !self->m_running) {
				                                  self->doDisconnect();
				                                  return;
			                                  }

			                                  if (self->m_callbacks.onMessage) {
				                                  self->m_callbacks.onMessage(*self, *payload);
			                                  }
			                                  self->startRead();
		                                  }));
	                 }));
}

void Connection::armIdleTimer() {
	if (m_limits.idleTimeout.count() <= 0) {
		return;
	}

	m_idleTimer.expires_after(m_limits.idleTimeout);
	m_idleTimer.async_wait(asio::bind_executor(m_strand, [weak = weak_from_this()](asio::error_code ec) {
		if (ec == asio::error::operation_aborted) {
			return;
		}
		if (auto self = weak.lock()) {
			if (self->m_idleTimer.expiry() > asio::steady_timer::clock_type::now()) {
				return; // Re-armed after this wait completed.
			}
			Logger().Log(Logging::LogLevel::Info, std::format("[Connection] Connection {} idle for too long.", self->m_connectionId));
			self->doDisconnect();
		}
	}));
}

void Connection::doDisconnect() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_idleTimer.cancel();
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(*this);
	}
}

} // namespace banchess::network::core
