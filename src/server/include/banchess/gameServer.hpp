#pragma once

#include "banchess/config.hpp"

#include <atomic>
#include <cstdint>
#include <memory>

namespace banchess::engine {
class IPersistenceSink;
class SessionRegistry;
class Matchmaker;
class TimerService;
class IAuthenticator;
} // namespace banchess::engine

namespace banchess::network::core {
class TcpServer;
}

namespace banchess::server {

class Multiplexer;

//! Composition root: owns the timer thread, the rules, the session registry, the matchmaker, the transport and the multiplexer.
class GameServer {
public:
	explicit GameServer(ServerConfig config);
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;
	GameServer(GameServer&&)                 = delete;
	GameServer& operator=(GameServer&&)      = delete;

	bool start(); //!< Boot the timer thread, the multiplexer and the network listener. Returns false if the port could not be bound.
	void stop();  //!< Stop accepting input, then shut down the sessions. Safe to call multiple times.

	std::uint16_t port() const; //!< Bound port.

	engine::SessionRegistry& registry(); //!< Recovery tooling and tests.

private:
	ServerConfig m_config;
	std::atomic<bool> m_isRunning{false};

	std::unique_ptr<engine::TimerService> m_timers;
	std::unique_ptr<engine::IPersistenceSink> m_sink;
	std::unique_ptr<engine::SessionRegistry> m_registry;
	std::unique_ptr<engine::Matchmaker> m_matchmaker;
	std::unique_ptr<engine::IAuthenticator> m_authenticator;
	std::unique_ptr<network::core::TcpServer> m_network; //!< Communication with clients.
	std::unique_ptr<Multiplexer> m_multiplexer;
};

} // namespace banchess::server
