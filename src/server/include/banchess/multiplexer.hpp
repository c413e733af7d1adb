#pragma once

#include "engine/ISessionObserver.hpp"
#include "engine/authenticator.hpp"
#include "engine/matchmaker.hpp"
#include "engine/sessionRegistry.hpp"
#include "engine/timerService.hpp"
#include "network/core/transport.hpp"

#include <chrono>
#include <memory>
#include <optional>

namespace banchess::server {

//! Connection multiplexer on two layers.
//! - Network layer: Talks to the transport, identifies a client through its connection id.
//! - Session layer: Authenticates connections, attaches them to sessions and fans out role specific snapshots.
//! \note All state lives on the multiplexer thread. Transport, worker and timer callbacks only enqueue events.
class Multiplexer final : public engine::ISessionObserver {
public:
	struct Options {
		std::chrono::milliseconds graceWindow{std::chrono::seconds(30)}; //!< Reserved seat time after the last player connection left.
		std::optional<engine::TimeControl> defaultTimeControl{engine::TimeControl{}};
		unsigned giveTimeSeconds{15}; //!< Used when give-time carries no amount.
	};

	Multiplexer(network::core::ITransport& transport, engine::SessionRegistry& registry, engine::Matchmaker& matchmaker,
	            const engine::IAuthenticator& authenticator, engine::TimerService& timers, Options options);
	~Multiplexer() override;

	Multiplexer(const Multiplexer&)            = delete;
	Multiplexer& operator=(const Multiplexer&) = delete;
	Multiplexer(Multiplexer&&)                 = delete;
	Multiplexer& operator=(Multiplexer&&)      = delete;

	void start(); //!< Start the event loop thread.
	void stop();  //!< Drop pending grace windows and join the event loop. Safe to call multiple times.

	// Transport callbacks. Safe to call from any thread.
	void onConnect(network::core::ConnectionId connectionId);
	void onMessage(network::core::ConnectionId connectionId, const network::core::Message& message);
	void onDisconnect(network::core::ConnectionId connectionId);

	// ISessionObserver: called on session worker threads.
	void onSessionUpdated(const engine::SessionId& sessionId, std::shared_ptr<const engine::SessionState> state) override;
	void onActionRejected(const engine::SessionId& sessionId, engine::OriginId origin, engine::ErrorCode code) override;
	void onSessionRemoved(const engine::SessionId& sessionId) override;

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to keep the event loop out of the public interface.
};

} // namespace banchess::server
