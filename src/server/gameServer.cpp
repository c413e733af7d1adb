#include "banchess/gameServer.hpp"
#include "banchess/multiplexer.hpp"
#include "logging.hpp"

#include "engine/authenticator.hpp"
#include "engine/matchmaker.hpp"
#include "engine/persistence.hpp"
#include "engine/sessionRegistry.hpp"
#include "engine/timerService.hpp"
#include "network/core/tcpServer.hpp"
#include "rules/banChessRules.hpp"

#include <chrono>
#include <format>
#include <utility>

namespace banchess::server {

GameServer::GameServer(ServerConfig config) : m_config(std::move(config)) {
	m_timers        = std::make_unique<engine::TimerService>();
	m_sink          = std::make_unique<engine::JsonFilePersistenceSink>(m_config.persistenceDir);
	m_registry      = std::make_unique<engine::SessionRegistry>(std::make_shared<const rules::BanChessRules>(), *m_timers, m_sink.get(),
                                                           std::chrono::seconds(m_config.retireDelaySeconds));
	m_matchmaker    = std::make_unique<engine::Matchmaker>(*m_registry);
	m_authenticator = std::make_unique<engine::GuestAuthenticator>(m_config.authToken);

	m_network = std::make_unique<network::core::TcpServer>(network::core::TcpServer::Options{
	        .port              = m_config.port,
	        .maxQueuedMessages = m_config.maxQueuedMessages,
	        .idleTimeout       = std::chrono::seconds(m_config.idleTimeoutSeconds),
	});

	m_multiplexer = std::make_unique<Multiplexer>(*m_network, *m_registry, *m_matchmaker, *m_authenticator, *m_timers,
	                                              Multiplexer::Options{
	                                                      .graceWindow        = std::chrono::seconds(m_config.graceWindowSeconds),
	                                                      .defaultTimeControl = m_config.defaultTimeControl,
	                                                      .giveTimeSeconds    = m_config.giveTimeSeconds,
	                                              });
	m_registry->registerObserver(m_multiplexer.get());

	// Wire up network callbacks but keep them thin: they only enqueue events.
	network::core::TcpServer::Callbacks callbacks;
	callbacks.onConnect    = [this](const network::core::ConnectionId& connectionId) { m_multiplexer->onConnect(connectionId); };
	callbacks.onMessage    = [this](const network::core::ConnectionId& connectionId, const network::core::Message& payload) {
		m_multiplexer->onMessage(connectionId, payload);
	};
	callbacks.onDisconnect = [this](const network::core::ConnectionId& connectionId) { m_multiplexer->onDisconnect(connectionId); };
	m_network->connect(std::move(callbacks));
}

GameServer::~GameServer() {
	stop();
	m_registry->shutdown(); // Workers must not signal a destroyed multiplexer.
}

bool GameServer::start() {
	if (m_isRunning.exchange(true)) {
		return true;
	}

	m_timers->start();
	m_multiplexer->start();
	if (!m_network->start()) {
		Logger().Log(Logging::LogLevel::Error, std::format("[GameServer] Could not listen on port {}.", m_config.port));
		m_multiplexer->stop();
		m_timers->stop();
		m_isRunning = false;
		return false;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Running on port {}.", m_network->port()));
	return true;
}

void GameServer::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	// Input first, then the sessions, then their timers.
	m_network->stop();
	m_multiplexer->stop();
	m_registry->shutdown();
	m_timers->stop();

	Logger().Log(Logging::LogLevel::Info, "[GameServer] Stopped.");
}

std::uint16_t GameServer::port() const {
	return m_network->port();
}

engine::SessionRegistry& GameServer::registry() {
	return *m_registry;
}

} // namespace banchess::server
