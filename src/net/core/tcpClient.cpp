#include "network/core/tcpClient.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read.hpp>
#include <asio/write.hpp>

#include <array>
#include <utility>

namespace banchess::network::core {

class TcpClient::Implementation {
public:
	Implementation();

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	std::optional<Message> receive(std::optional<std::chrono::milliseconds> timeout); //!< Empty timeout waits forever.

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;

	bool m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext) {
}

bool TcpClient::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		return false;
	}

	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected || message.size() > MAX_REQUEST_BYTES) {
		return false;
	}

	const BasicMessageHeader header{.payload_size = to_network_u32(static_cast<std::uint32_t>(message.size()))};
	const std::array<asio::const_buffer, 2> frame{asio::buffer(&header, sizeof(header)), asio::buffer(message)};

	asio::error_code ec;
	asio::write(m_socket, frame, ec);
	if (ec) {
		disconnect();
		return false;
	}
	return true;
}

std::optional<Message> TcpClient::Implementation::receive(std::optional<std::chrono::milliseconds> timeout) {
	if (!m_isConnected) {
		return {};
	}

	BasicMessageHeader header{};
	Message payload;
	std::optional<asio::error_code> result; // Set once the frame is complete or failed.

	asio::async_read(m_socket, asio::buffer(&header, sizeof(header)), [&](asio::error_code ec, std::size_t) {
		if (ec) {
			result = ec;
			return;
		}
		const auto payloadSize = from_network_u32(header.payload_size);
		if (payloadSize > MAX_PAYLOAD_BYTES) {
			result = asio::error::message_size;
			return;
		}
		payload.assign(payloadSize, '\0');
		asio::async_read(m_socket, asio::buffer(payload), [&](asio::error_code ec1, std::size_t) { result = ec1; });
	});

	m_ioContext.restart();
	if (timeout) {
		m_ioContext.run_for(*timeout);
	} else {
		m_ioContext.run();
	}

	if (!result) {
		// Deadline passed. Cancel and drain the handlers, they reference this frame.
		disconnect();
		m_ioContext.restart();
		m_ioContext.run();
		return {};
	}
	if (*result) {
		disconnect();
		return {};
	}
	return payload;
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

Message TcpClient::read() {
	return m_pimpl->receive(std::nullopt).value_or(Message{});
}

std::optional<Message> TcpClient::read(std::chrono::milliseconds timeout) {
	return m_pimpl->receive(timeout);
}

} // namespace banchess::network::core
