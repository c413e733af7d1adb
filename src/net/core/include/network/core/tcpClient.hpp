#pragma once

#include "network/core/protocol.hpp"

#include <chrono>
#include <cstdint>
#include <memory>
#include <optional>
#include <string>

namespace banchess::network::core {

//! Blocking client for the framed protocol. Used by tools and end-to-end tests.
//! \note Not thread safe. Any network failure marks the client disconnected.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(const std::string& host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Write one frame. Returns false on failure.
	Message read();                    //!< Wait for one frame. Returns empty if disconnected.

	//! Wait at most timeout for one frame. Returns empty on timeout or failure.
	//! \note A timeout drops the connection since the stream may be left inside a frame.
	std::optional<Message> read(std::chrono::milliseconds timeout);

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace banchess::network::core
