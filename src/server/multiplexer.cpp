#include "banchess/multiplexer.hpp"
#include "connectionManager.hpp"
#include "logging.hpp"
#include "serverEvents.hpp"

#include "engine/SafeQueue.hpp"
#include "engine/snapshot.hpp"
#include "network/nwEvents.hpp"

#include <atomic>
#include <format>
#include <map>
#include <thread>
#include <utility>

namespace banchess::server {

using engine::ErrorCode;
using engine::Seat;

class Multiplexer::Implementation {
public:
	Implementation(network::core::ITransport& transport, engine::SessionRegistry& registry, engine::Matchmaker& matchmaker,
	               const engine::IAuthenticator& authenticator, engine::TimerService& timers, Options options);

	void start();
	void stop();

	void push(ServerEvent event); //!< Hand an event to the server thread.

private:
	void serverLoop();                           //!< Server thread: drain queue and act.
	void processEvent(const ServerEvent& event); //!< Server loop calls this. Reads event type and distributes.

private:
	// Processing of server events.
	void processClientConnect(const ServerEvent& event);
	void processClientDisconnect(const ServerEvent& event);
	void processClientMessage(const ServerEvent& event); //!< Translate payload to client event and handle.
	void processSessionUpdate(const ServerEvent& event); //!< Fan out the new state to every attached connection.
	void processActionRejected(const ServerEvent& event);
	void processSessionRemoved(const ServerEvent& event); //!< Detach everyone still looking at a retired session.
	void processGraceExpired(const ServerEvent& event);

private:
	// Processing of the client events that are sent in the server event message payload.
	void handle(ConnectionContext& context, const network::ClientAuthenticate& event);
	void handle(ConnectionContext& context, const network::ClientCreateSolo& event);
	void handle(ConnectionContext& context, const network::ClientJoinQueue& event);
	void handle(ConnectionContext& context, const network::ClientLeaveQueue& event);
	void handle(ConnectionContext& context, const network::ClientAttach& event);
	void handle(ConnectionContext& context, const network::ClientDetach& event);
	void handle(ConnectionContext& context, const network::ClientAction& event);
	void handle(ConnectionContext& context, const network::ClientResign& event);
	void handle(ConnectionContext& context, const network::ClientOfferDraw& event);
	void handle(ConnectionContext& context, const network::ClientAcceptDraw& event);
	void handle(ConnectionContext& context, const network::ClientGiveTime& event);
	void handle(ConnectionContext& context, const network::ClientPing& event);

private:
	void send(ConnectionId connectionId, const network::ServerEvent& event);
	void sendError(ConnectionId connectionId, ErrorCode code);
	void sendSnapshot(ConnectionContext& context, const engine::SessionState& state); //!< Skips versions the connection already has.

	void detach(ConnectionContext& context); //!< Drop the attachment and start a grace window for an emptied player seat.
	void post(ConnectionContext& context, const engine::SessionId& sessionId, engine::SessionCommand command);

	void notifyMatch(const engine::Match& match);
	void broadcastQueuePositions();
	std::optional<engine::TimeControl> resolve(const network::TimeControlRequest& request) const;

	void reserveSeat(const engine::SessionId& sessionId, Seat seat); //!< Grace window for a new seat until its player attaches.
	void startGraceWindow(const engine::SessionId& sessionId, Seat seat);
	void cancelGraceWindow(const engine::SessionId& sessionId, Seat seat);
	void cancelGraceWindows(const engine::SessionId& sessionId);
	void cancelAllGraceWindows();

private:
	struct GraceWindow {
		engine::TimerService::TimerId timer;
		std::uint64_t token;
	};
	using GraceKey = std::pair<engine::SessionId, Seat>;

	network::core::ITransport& m_transport;
	engine::SessionRegistry& m_registry;
	engine::Matchmaker& m_matchmaker;
	const engine::IAuthenticator& m_authenticator;
	engine::TimerService& m_timers;
	Options m_options;

	std::atomic<bool> m_isRunning{false};
	std::thread m_serverThread;
	std::shared_ptr<SafeQueue<ServerEvent>> m_eventQueue; //!< Timer callbacks hold a weak reference.

	// Only touched by the server thread.
	ConnectionManager m_connections;
	std::map<GraceKey, GraceWindow> m_graceWindows;
	std::uint64_t m_nextGraceToken{1};
};


Multiplexer::Implementation::Implementation(network::core::ITransport& transport, engine::SessionRegistry& registry, engine::Matchmaker& matchmaker,
                                            const engine::IAuthenticator& authenticator, engine::TimerService& timers, Options options)
    : m_transport(transport), m_registry(registry), m_matchmaker(matchmaker), m_authenticator(authenticator), m_timers(timers),
      m_options(std::move(options)), m_eventQueue(std::make_shared<SafeQueue<ServerEvent>>()) {
}

void Multiplexer::Implementation::start() {
	if (m_isRunning.exchange(true)) {
		return;
	}
	m_serverThread = std::thread([this] { serverLoop(); });
}

void Multiplexer::Implementation::stop() {
	if (!m_isRunning.exchange(false)) {
		return;
	}

	// Wake serverLoop.
	m_eventQueue->Push(ServerEvent{.type = ServerEventType::Shutdown});
	m_eventQueue->Release();

	if (m_serverThread.joinable()) {
		m_serverThread.join();
	}
	cancelAllGraceWindows();
}

void Multiplexer::Implementation::push(ServerEvent event) {
	m_eventQueue->Push(std::move(event));
}

void Multiplexer::Implementation::serverLoop() {
	Logger().Log(Logging::LogLevel::Info, "[Multiplexer] Event loop started.");

	while (auto event = m_eventQueue->Pop()) {
		if (event->type == ServerEventType::Shutdown) {
			break;
		}
		try {
			processEvent(*event);
		} catch (const std::exception& ex) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Multiplexer] Processing event failed: {}", ex.what()));
		}
	}

	Logger().Log(Logging::LogLevel::Info, "[Multiplexer] Event loop stopped.");
}

void Multiplexer::Implementation::processEvent(const ServerEvent& event) {
	switch (event.type) {
	case ServerEventType::ClientConnected:
		processClientConnect(event);
		break;
	case ServerEventType::ClientDisconnected:
		processClientDisconnect(event);
		break;
	case ServerEventType::ClientMessage:
		processClientMessage(event);
		break;
	case ServerEventType::SessionUpdated:
		processSessionUpdate(event);
		break;
	case ServerEventType::ActionRejected:
		processActionRejected(event);
		break;
	case ServerEventType::SessionRemoved:
		processSessionRemoved(event);
		break;
	case ServerEventType::GraceExpired:
		processGraceExpired(event);
		break;
	case ServerEventType::Shutdown:
		break;
	}
}

void Multiplexer::Implementation::processClientConnect(const ServerEvent& event) {
	if (!m_connections.add(event.connectionId)) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Multiplexer] Connection '{}' registered twice.", event.connectionId));
		return;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Client '{}' connected.", event.connectionId));
}

void Multiplexer::Implementation::processClientDisconnect(const ServerEvent& event) {
	auto* context = m_connections.find(event.connectionId);
	if (!context) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Multiplexer] Unknown connection '{}' disconnected.", event.connectionId));
		return;
	}

	if (context->attachedTo) {
		detach(*context);
	}

	// Waiting in the queue needs a live connection.
	if (context->identity && m_connections.connectionsOf(context->identity->userId).size() == 1u && m_matchmaker.isQueued(context->identity->userId)) {
		m_matchmaker.leave(context->identity->userId);
		broadcastQueuePositions();
	}

	m_connections.remove(event.connectionId);
	Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Client '{}' disconnected.", event.connectionId));
}

void Multiplexer::Implementation::processClientMessage(const ServerEvent& event) {
	auto* context = m_connections.find(event.connectionId);
	if (!context) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Multiplexer] Message from unknown connection '{}'.", event.connectionId));
		return;
	}

	// Server event message contains a client event. Parse and handle.
	const auto clientEvent = network::fromClientMessage(event.payload);
	if (!clientEvent) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Multiplexer] Could not parse client '{}' payload: '{}'.", event.connectionId, event.payload));
		sendError(event.connectionId, ErrorCode::MalformedMessage);
		return;
	}

	if (!context->identity && !std::holds_alternative<network::ClientAuthenticate>(*clientEvent)) {
		sendError(event.connectionId, ErrorCode::NotAuthenticated);
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[Multiplexer] Message from client '{}': '{}'.", event.connectionId, event.payload));
	std::visit([&](const auto& e) { handle(*context, e); }, *clientEvent);
}

void Multiplexer::Implementation::processSessionUpdate(const ServerEvent& event) {
	if (!event.state) {
		return;
	}

	for (const auto connectionId: m_connections.attachedTo(event.sessionId)) {
		if (auto* context = m_connections.find(connectionId)) {
			sendSnapshot(*context, *event.state);
		}
	}

	if (event.state->status == engine::SessionStatus::Finished) {
		cancelGraceWindows(event.sessionId);
	}
}

void Multiplexer::Implementation::processActionRejected(const ServerEvent& event) {
	if (!m_connections.find(event.connectionId)) {
		return; // Sender is gone.
	}
	Logger().Log(Logging::LogLevel::Debug,
	             std::format("[Multiplexer] Session '{}' rejected command of client '{}': {}", event.sessionId, event.connectionId, engine::toString(event.code)));
	sendError(event.connectionId, event.code);
}

void Multiplexer::Implementation::processSessionRemoved(const ServerEvent& event) {
	cancelGraceWindows(event.sessionId);
	m_matchmaker.forget(event.sessionId);

	for (const auto connectionId: m_connections.attachedTo(event.sessionId)) {
		if (auto* context = m_connections.find(connectionId)) {
			context->attachedTo.reset();
			context->seat = Seat::None;
			context->lastVersion.reset();
			send(connectionId, network::ServerDetached{.sessionId = event.sessionId});
		}
	}
	Logger().Log(Logging::LogLevel::Debug, std::format("[Multiplexer] Session '{}' removed.", event.sessionId));
}

void Multiplexer::Implementation::processGraceExpired(const ServerEvent& event) {
	const auto it = m_graceWindows.find(GraceKey{event.sessionId, event.seat});
	if (it == m_graceWindows.end() || it->second.token != event.token) {
		return; // Cancelled by a reattach.
	}
	m_graceWindows.erase(it);

	if (m_connections.seatTaken(event.sessionId, event.seat, 0)) {
		return;
	}
	const auto worker = m_registry.get(event.sessionId);
	if (!worker) {
		return;
	}
	const auto state = worker->state();
	if (!state || state->status != engine::SessionStatus::Active) {
		return;
	}

	// A solo player holds both colors. The color that has to act loses.
	const auto loser = state->mode == engine::GameMode::Solo ? state->legal.actor
	                                                         : (event.seat == Seat::White ? rules::Color::White : rules::Color::Black);
	Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Grace window of {} in session '{}' expired.", rules::toString(loser), event.sessionId));
	worker->post(engine::ForfeitCommand{.loser = loser});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientAuthenticate& event) {
	if (context.identity) {
		sendError(context.connectionId, ErrorCode::AlreadyAuthenticated);
		return;
	}

	const auto identity = m_authenticator.authenticate(engine::Credentials{.userId = event.userId, .username = event.username, .token = event.token});
	if (!identity) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Multiplexer] Authentication of client '{}' failed.", context.connectionId));
		sendError(context.connectionId, ErrorCode::AuthFailed);
		return;
	}

	context.identity = *identity;
	Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Client '{}' authenticated as '{}'.", context.connectionId, identity->userId));
	send(context.connectionId, network::ServerAuthenticated{.identity = *identity, .activeSessions = m_registry.activeSessionsFor(identity->userId)});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientCreateSolo& event) {
	const auto timeControl = resolve(event.timeControl);
	const auto sessionId   = m_matchmaker.createSolo(*context.identity, timeControl);
	send(context.connectionId, network::ServerGameCreated{.sessionId = sessionId, .timeControl = timeControl});
	reserveSeat(sessionId, Seat::White | Seat::Black);
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientJoinQueue& event) {
	const auto result = m_matchmaker.enqueue(*context.identity, resolve(event.timeControl));
	if (result.error != ErrorCode::None) {
		sendError(context.connectionId, result.error);
		return;
	}

	if (result.match) {
		notifyMatch(*result.match);
	}
	broadcastQueuePositions();
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientLeaveQueue&) {
	const auto result = m_matchmaker.leave(context.identity->userId);
	switch (result.error) {
	case ErrorCode::None:
		send(context.connectionId, network::ServerQueueLeft{.result = network::QueueLeftResult::Left, .sessionId = std::nullopt});
		broadcastQueuePositions();
		break;
	case ErrorCode::AlreadyMatched:
		send(context.connectionId, network::ServerQueueLeft{.result = network::QueueLeftResult::AlreadyMatched, .sessionId = result.sessionId});
		break;
	default:
		sendError(context.connectionId, result.error);
		break;
	}
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientAttach& event) {
	if (context.attachedTo && *context.attachedTo != event.sessionId) {
		sendError(context.connectionId, ErrorCode::AlreadyAttached);
		return;
	}

	const auto worker = m_registry.get(event.sessionId);
	const auto state  = worker ? worker->state() : nullptr;
	if (!state) {
		sendError(context.connectionId, ErrorCode::SessionNotFound);
		return;
	}

	// Attaching again to the same session re-sends the full snapshot.
	if (context.attachedTo) {
		context.lastVersion.reset();
		sendSnapshot(context, *state);
		return;
	}

	const auto seat = state->participants.seatOf(context.identity->userId);
	if (state->status == engine::SessionStatus::Finished) {
		send(context.connectionId, network::ServerState{.view = engine::projectFor(*state, seat)});
		sendError(context.connectionId, ErrorCode::SessionFinished);
		return;
	}
	if (engine::isPlayer(seat) && m_connections.seatTaken(event.sessionId, seat, context.connectionId)) {
		sendError(context.connectionId, ErrorCode::SeatOccupied);
		return;
	}

	context.attachedTo = event.sessionId;
	context.seat       = seat;
	context.lastVersion.reset();
	if (engine::isPlayer(seat)) {
		cancelGraceWindow(event.sessionId, seat);
	}

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[Multiplexer] Client '{}' attached to '{}' as {}.", context.connectionId, event.sessionId, network::toString(seat)));
	sendSnapshot(context, *state);
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientDetach&) {
	if (!context.attachedTo) {
		sendError(context.connectionId, ErrorCode::NotAttached);
		return;
	}

	const auto sessionId = *context.attachedTo;
	detach(context);
	send(context.connectionId, network::ServerDetached{.sessionId = sessionId});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientAction& event) {
	post(context, event.sessionId, engine::SubmitCommand{.seat = context.seat, .action = event.action});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientResign& event) {
	post(context, event.sessionId, engine::ResignCommand{.seat = context.seat});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientOfferDraw& event) {
	post(context, event.sessionId, engine::OfferDrawCommand{.seat = context.seat});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientAcceptDraw& event) {
	post(context, event.sessionId, engine::AcceptDrawCommand{.seat = context.seat});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientGiveTime& event) {
	post(context, event.sessionId, engine::GiveTimeCommand{.seat = context.seat, .seconds = event.seconds.value_or(m_options.giveTimeSeconds)});
}

void Multiplexer::Implementation::handle(ConnectionContext& context, const network::ClientPing&) {
	send(context.connectionId, network::ServerPong{});
}

void Multiplexer::Implementation::send(ConnectionId connectionId, const network::ServerEvent& event) {
	if (!m_transport.send(connectionId, network::toMessage(event))) {
		Logger().Log(Logging::LogLevel::Debug, std::format("[Multiplexer] Connection '{}' is gone. Message dropped.", connectionId));
	}
}

void Multiplexer::Implementation::sendError(ConnectionId connectionId, ErrorCode code) {
	send(connectionId, network::ServerError{.code = code, .message = engine::errorMessage(code)});
}

void Multiplexer::Implementation::sendSnapshot(ConnectionContext& context, const engine::SessionState& state) {
	if (context.lastVersion && state.version <= *context.lastVersion) {
		return;
	}
	context.lastVersion = state.version;
	send(context.connectionId, network::ServerState{.view = engine::projectFor(state, context.seat)});
}

void Multiplexer::Implementation::detach(ConnectionContext& context) {
	const auto sessionId = *context.attachedTo;
	const auto seat      = context.seat;

	context.attachedTo.reset();
	context.seat = Seat::None;
	context.lastVersion.reset();
	Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Client '{}' detached from '{}'.", context.connectionId, sessionId));

	if (!engine::isPlayer(seat) || m_connections.seatTaken(sessionId, seat, context.connectionId)) {
		return;
	}
	const auto worker = m_registry.get(sessionId);
	const auto state  = worker ? worker->state() : nullptr;
	if (state && state->status == engine::SessionStatus::Active) {
		startGraceWindow(sessionId, seat);
	}
}

void Multiplexer::Implementation::post(ConnectionContext& context, const engine::SessionId& sessionId, engine::SessionCommand command) {
	if (context.attachedTo != sessionId) {
		sendError(context.connectionId, ErrorCode::NotAttached);
		return;
	}

	const auto worker = m_registry.get(sessionId);
	if (!worker) {
		sendError(context.connectionId, ErrorCode::SessionNotFound);
		return;
	}
	// Rejections come back through onActionRejected with this connection as origin.
	worker->post(std::move(command), context.connectionId);
}

void Multiplexer::Implementation::notifyMatch(const engine::Match& match) {
	for (const auto color: {rules::Color::White, rules::Color::Black}) {
		const auto& identity = match.participants.of(color);
		const network::ServerMatched event{.sessionId = match.sessionId, .color = color, .opponent = match.participants.of(rules::opponent(color))};
		for (const auto connectionId: m_connections.connectionsOf(identity.userId)) {
			send(connectionId, event);
		}
		reserveSeat(match.sessionId, color == rules::Color::White ? Seat::White : Seat::Black);
	}
}

void Multiplexer::Implementation::broadcastQueuePositions() {
	for (const auto& queued: m_matchmaker.positions()) {
		for (const auto connectionId: m_connections.connectionsOf(queued.identity.userId)) {
			send(connectionId, network::ServerQueuePosition{.position = queued.position});
		}
	}
}

std::optional<engine::TimeControl> Multiplexer::Implementation::resolve(const network::TimeControlRequest& request) const {
	return request ? *request : m_options.defaultTimeControl;
}

void Multiplexer::Implementation::reserveSeat(const engine::SessionId& sessionId, Seat seat) {
	if (!m_connections.seatTaken(sessionId, seat, 0)) {
		startGraceWindow(sessionId, seat);
	}
}

void Multiplexer::Implementation::startGraceWindow(const engine::SessionId& sessionId, Seat seat) {
	const GraceKey key{sessionId, seat};
	if (m_graceWindows.contains(key)) {
		return;
	}

	const auto token = m_nextGraceToken++;
	const auto timer = m_timers.schedule(m_options.graceWindow, [queue = std::weak_ptr(m_eventQueue), sessionId, seat, token] {
		if (auto events = queue.lock()) {
			events->Push(ServerEvent{.type = ServerEventType::GraceExpired, .sessionId = sessionId, .seat = seat, .token = token});
		}
	});
	m_graceWindows.emplace(key, GraceWindow{.timer = timer, .token = token});

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[Multiplexer] Seat {} of session '{}' is empty. Forfeit in {} ms.", network::toString(seat), sessionId, m_options.graceWindow.count()));
}

void Multiplexer::Implementation::cancelGraceWindow(const engine::SessionId& sessionId, Seat seat) {
	if (const auto it = m_graceWindows.find(GraceKey{sessionId, seat}); it != m_graceWindows.end()) {
		m_timers.cancel(it->second.timer);
		m_graceWindows.erase(it);
		Logger().Log(Logging::LogLevel::Info, std::format("[Multiplexer] Seat {} of session '{}' reclaimed.", network::toString(seat), sessionId));
	}
}

void Multiplexer::Implementation::cancelGraceWindows(const engine::SessionId& sessionId) {
	std::erase_if(m_graceWindows, [&](const auto& entry) {
		if (entry.first.first != sessionId) {
			return false;
		}
		m_timers.cancel(entry.second.timer);
		return true;
	});
}

void Multiplexer::Implementation::cancelAllGraceWindows() {
	for (const auto& [key, window]: m_graceWindows) {
		m_timers.cancel(window.timer);
	}
	m_graceWindows.clear();
}


Multiplexer::Multiplexer(network::core::ITransport& transport, engine::SessionRegistry& registry, engine::Matchmaker& matchmaker,
                         const engine::IAuthenticator& authenticator, engine::TimerService& timers, Options options)
    : m_pimpl(std::make_unique<Implementation>(transport, registry, matchmaker, authenticator, timers, std::move(options))) {
}

Multiplexer::~Multiplexer() {
	stop();
}

void Multiplexer::start() {
	m_pimpl->start();
}

void Multiplexer::stop() {
	m_pimpl->stop();
}

void Multiplexer::onConnect(network::core::ConnectionId connectionId) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::ClientConnected, .connectionId = connectionId});
}

void Multiplexer::onMessage(network::core::ConnectionId connectionId, const network::core::Message& message) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::ClientMessage, .connectionId = connectionId, .payload = message});
}

void Multiplexer::onDisconnect(network::core::ConnectionId connectionId) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::ClientDisconnected, .connectionId = connectionId});
}

void Multiplexer::onSessionUpdated(const engine::SessionId& sessionId, std::shared_ptr<const engine::SessionState> state) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::SessionUpdated, .sessionId = sessionId, .state = std::move(state)});
}

void Multiplexer::onActionRejected(const engine::SessionId& sessionId, engine::OriginId origin, engine::ErrorCode code) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::ActionRejected, .connectionId = origin, .sessionId = sessionId, .code = code});
}

void Multiplexer::onSessionRemoved(const engine::SessionId& sessionId) {
	m_pimpl->push(ServerEvent{.type = ServerEventType::SessionRemoved, .sessionId = sessionId});
}

} // namespace banchess::server
