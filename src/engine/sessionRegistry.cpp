#include "engine/sessionRegistry.hpp"
#include "logging.hpp"

#include <algorithm>
#include <format>
#include <random>
#include <utility>

namespace banchess::engine {

static std::string randomSalt() {
	std::random_device device;
	std::uniform_int_distribution<std::uint32_t> distribution;
	return std::format("{:08x}", distribution(device));
}

SessionRegistry::SessionRegistry(std::shared_ptr<const rules::IRulesEngine> rules, TimerService& timers, IPersistenceSink* sink,
                                 std::chrono::milliseconds retireDelay)
    : m_rules(std::move(rules)), m_timers(timers), m_sink(sink), m_retireDelay(retireDelay), m_salt(randomSalt()),
      m_lifetime(std::make_shared<char>()) {
}

SessionRegistry::~SessionRegistry() {
	shutdown();
}

bool SessionRegistry::registerObserver(ISessionObserver* observer) {
	if (m_observer) {
		return false;
	}
	m_observer = observer;
	return true;
}

SessionId SessionRegistry::create(Participants participants, GameMode mode, std::optional<TimeControl> timeControl) {
	const auto sessionId = generateSessionId();

	Session session(sessionId, mode, std::move(participants), timeControl, *m_rules);
	if (mode == GameMode::Solo) {
		session.start(std::chrono::steady_clock::now());
	}
	launch(std::move(session));

	Logger().Log(Logging::LogLevel::Info, std::format("[Registry] Created {} session '{}' ({}).", toString(mode), sessionId, timeControlKey(timeControl)));
	return sessionId;
}

ErrorCode SessionRegistry::activate(const SessionId& sessionId) {
	const auto worker = get(sessionId);
	if (!worker) {
		return ErrorCode::SessionNotFound;
	}
	return worker->post(StartCommand{}).get();
}

std::shared_ptr<SessionWorker> SessionRegistry::get(const SessionId& sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	const auto it = m_sessions.find(sessionId);
	return it == m_sessions.end() ? nullptr : it->second;
}

bool SessionRegistry::retire(const SessionId& sessionId) {
	std::shared_ptr<const SessionState> state;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_sessions.find(sessionId);
		if (it == m_sessions.end() || m_retiring.contains(sessionId)) {
			return false;
		}
		state = it->second->state();
		if (!state || state->status != SessionStatus::Finished) {
			return false;
		}
		m_retiring.insert(sessionId);
	}

	if (m_sink) {
		try {
			if (!m_sink->save(toRecord(*state))) {
				Logger().Log(Logging::LogLevel::Error, std::format("[Registry] Could not persist session '{}'.", sessionId));
			}
		} catch (const std::exception& ex) {
			Logger().Log(Logging::LogLevel::Error, std::format("[Registry] Persisting session '{}' failed: {}", sessionId, ex.what()));
		}
	}

	std::weak_ptr<char> lifetime = m_lifetime;
	m_timers.schedule(m_retireDelay, [this, lifetime, sessionId]() {
		if (lifetime.expired()) {
			return;
		}
		remove(sessionId);
	});
	return true;
}

std::optional<SessionId> SessionRegistry::resume(const GameRecord& record) {
	if (record.result && record.result->reason != TerminationReason::Error) {
		return {};
	}
	if (get(record.sessionId)) {
		return {};
	}

	Session session(record.sessionId, record.mode, record.participants, record.timeControl, *m_rules);
	for (const auto& entry: record.history) {
		if (const auto code = session.restore(entry); code != ErrorCode::None) {
			Logger().Log(Logging::LogLevel::Warning,
			             std::format("[Registry] Cannot resume '{}': ply {} rejected with {}.", record.sessionId, entry.ply, toString(code)));
			return {};
		}
	}
	session.start(std::chrono::steady_clock::now());

	const bool finished = session.state().status == SessionStatus::Finished;
	launch(std::move(session));
	if (finished) {
		retire(record.sessionId);
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[Registry] Resumed session '{}' at ply {}.", record.sessionId, record.history.size()));
	return record.sessionId;
}

std::vector<SessionId> SessionRegistry::activeSessionsFor(const UserId& userId) const {
	std::vector<SessionId> ids;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		for (const auto& [id, worker]: m_sessions) {
			const auto state = worker->state();
			if (state && state->status != SessionStatus::Finished && state->participants.contains(userId)) {
				ids.push_back(id);
			}
		}
	}
	std::ranges::sort(ids);
	return ids;
}

std::size_t SessionRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

void SessionRegistry::shutdown() {
	std::unordered_map<SessionId, std::shared_ptr<SessionWorker>> sessions;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		m_shutdown = true;
		sessions.swap(m_sessions);
		m_retiring.clear();
	}
	for (auto& [id, worker]: sessions) {
		worker->stop();
	}
}

void SessionRegistry::onSessionUpdated(const SessionId& sessionId, std::shared_ptr<const SessionState> state) {
	const bool finished = state->status == SessionStatus::Finished;
	if (m_observer) {
		m_observer->onSessionUpdated(sessionId, std::move(state));
	}
	if (finished) {
		retire(sessionId);
	}
}

void SessionRegistry::onActionRejected(const SessionId& sessionId, OriginId origin, ErrorCode code) {
	if (m_observer) {
		m_observer->onActionRejected(sessionId, origin, code);
	}
}

SessionId SessionRegistry::generateSessionId() {
	return std::format("{}-{}", m_salt, ++m_sequence);
}

std::shared_ptr<SessionWorker> SessionRegistry::launch(Session session) {
	auto worker = std::make_shared<SessionWorker>(std::move(session), m_timers, this);
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_shutdown) {
			return nullptr;
		}
		m_sessions.emplace(worker->id(), worker);
	}
	worker->start();
	return worker;
}

void SessionRegistry::remove(const SessionId& sessionId) {
	std::shared_ptr<SessionWorker> worker;
	{
		std::lock_guard<std::mutex> lock(m_mutex);
		const auto it = m_sessions.find(sessionId);
		if (it == m_sessions.end()) {
			return;
		}
		worker = std::move(it->second);
		m_sessions.erase(it);
		m_retiring.erase(sessionId);
	}

	worker->stop();
	Logger().Log(Logging::LogLevel::Debug, std::format("[Registry] Removed session '{}'.", sessionId));
	if (m_observer) {
		m_observer->onSessionRemoved(sessionId);
	}
}

} // namespace banchess::engine
