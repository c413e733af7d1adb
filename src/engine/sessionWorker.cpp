#include "engine/sessionWorker.hpp"
#include "logging.hpp"

#include <format>
#include <utility>

namespace banchess::engine {

//! Expiry fires slightly after the flag so the clock reads zero.
static constexpr std::chrono::milliseconds CLOCK_EXPIRY_MARGIN{5};

static std::chrono::steady_clock::time_point now() {
	return std::chrono::steady_clock::now();
}

SessionWorker::SessionWorker(Session session, TimerService& timers, ISessionObserver* observer)
    : m_id(session.state().id), m_session(std::move(session)), m_timers(timers), m_observer(observer), m_state(m_session.publish(now())) {
}

SessionWorker::~SessionWorker() {
	stop();
}

void SessionWorker::start() {
	if (m_thread.joinable()) {
		return;
	}
	m_thread = std::thread([this] { run(); });
}

void SessionWorker::stop() {
	std::call_once(m_stopFlag, [this] {
		post(ShutdownCommand{});
		if (m_thread.joinable()) {
			if (m_thread.get_id() != std::this_thread::get_id()) {
				m_thread.join();
			} else {
				m_thread.detach();
			}
		}
	});
}

std::future<ErrorCode> SessionWorker::post(SessionCommand command, OriginId origin) {
	auto promise = std::make_shared<std::promise<ErrorCode>>();
	auto future  = promise->get_future();

	std::lock_guard<std::mutex> lock(m_postMutex);
	if (m_closed) {
		promise->set_value(ErrorCode::GameNotActive);
		return future;
	}
	m_queue.Push(Envelope{.command = std::move(command), .origin = origin, .result = std::move(promise)});
	return future;
}

const SessionId& SessionWorker::id() const {
	return m_id;
}

std::shared_ptr<const SessionState> SessionWorker::state() const {
	std::lock_guard<std::mutex> lock(m_stateMutex);
	return m_state;
}

void SessionWorker::run() {
	m_running = true;
	scheduleClock(); // Solo sessions are active before the worker starts.

	while (m_running) {
		auto envelope = m_queue.Pop();
		if (!envelope) {
			break;
		}

		ErrorCode code = ErrorCode::None;
		try {
			code = std::visit([&](const auto& command) { return handle(command); }, envelope->command);
		} catch (const std::exception& ex) {
			// A fault only ends this session.
			Logger().Log(Logging::LogLevel::Error, std::format("[Session {}] Command failed: {}", m_id, ex.what()));
			m_session.fail(now());
			code = ErrorCode::InternalError;
		}

		publish();

		if (code != ErrorCode::None && envelope->origin != NO_ORIGIN && m_observer) {
			m_observer->onActionRejected(m_id, envelope->origin, code);
		}
		envelope->result->set_value(code);
	}

	if (m_clockTimer) {
		m_timers.cancel(*m_clockTimer);
		m_clockTimer.reset();
	}

	// Commands that arrived after shutdown still resolve their futures.
	{
		std::lock_guard<std::mutex> lock(m_postMutex);
		m_closed = true;
	}
	m_queue.Release();
	while (auto rest = m_queue.Pop()) {
		rest->result->set_value(ErrorCode::GameNotActive);
	}
}

ErrorCode SessionWorker::handle(const StartCommand&) {
	return m_session.start(now());
}

ErrorCode SessionWorker::handle(const SubmitCommand& command) {
	return m_session.submit(command.seat, command.action, now());
}

ErrorCode SessionWorker::handle(const ResignCommand& command) {
	return m_session.resign(command.seat, now());
}

ErrorCode SessionWorker::handle(const OfferDrawCommand& command) {
	return m_session.offerDraw(command.seat);
}

ErrorCode SessionWorker::handle(const AcceptDrawCommand& command) {
	return m_session.acceptDraw(command.seat, now());
}

ErrorCode SessionWorker::handle(const GiveTimeCommand& command) {
	return m_session.giveTime(command.seat, command.seconds, now());
}

ErrorCode SessionWorker::handle(const ClockExpiredCommand& command) {
	if (command.generation != m_clockGeneration) {
		return ErrorCode::None; // Stale: an action was accepted in the meantime.
	}
	if (!m_session.checkClock(now())) {
		// Time was added or the timer fired early. Re-arm for the rest.
		scheduleClock();
	}
	return ErrorCode::None;
}

ErrorCode SessionWorker::handle(const ForfeitCommand& command) {
	return m_session.forfeit(command.loser, now());
}

ErrorCode SessionWorker::handle(const ShutdownCommand&) {
	m_running = false;
	return ErrorCode::None;
}

void SessionWorker::publish() {
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		if (m_state && m_state->version == m_session.state().version) {
			return;
		}
	}

	auto next = m_session.publish(now());
	{
		std::lock_guard<std::mutex> lock(m_stateMutex);
		m_state = next;
	}
	scheduleClock();

	if (next->status == SessionStatus::Finished && next->result) {
		Logger().Log(Logging::LogLevel::Info, std::format("[Session {}] Finished: {} after {} actions.", m_id, toString(next->result->reason),
		                                                  next->history.size()));
	}

	if (m_observer) {
		m_observer->onSessionUpdated(m_id, std::move(next));
	}
}

void SessionWorker::scheduleClock() {
	if (m_clockTimer) {
		m_timers.cancel(*m_clockTimer);
		m_clockTimer.reset();
	}
	++m_clockGeneration;

	const auto remaining = m_session.timeUntilFlag(now());
	if (!remaining) {
		return;
	}

	const auto generation = m_clockGeneration;
	std::weak_ptr<SessionWorker> weak = weak_from_this();
	m_clockTimer = m_timers.schedule(*remaining + CLOCK_EXPIRY_MARGIN, [weak, generation]() {
		if (auto self = weak.lock()) {
			self->post(ClockExpiredCommand{generation});
		}
	});
}

} // namespace banchess::engine
