#pragma once

#include "engine/ISessionObserver.hpp"
#include "engine/persistence.hpp"
#include "engine/sessionWorker.hpp"
#include "engine/timerService.hpp"
#include "rules/rulesEngine.hpp"

#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <unordered_set>
#include <vector>

namespace banchess::engine {

//! Single owner of all live sessions.
//! Finished sessions are persisted and removed after a retire delay so late spectators still get the final state.
//! \note The id map is shared between threads; everything inside a session is only touched by its worker.
class SessionRegistry final : public ISessionObserver {
public:
	SessionRegistry(std::shared_ptr<const rules::IRulesEngine> rules, TimerService& timers, IPersistenceSink* sink,
	                std::chrono::milliseconds retireDelay);
	~SessionRegistry() override;

	SessionRegistry(const SessionRegistry&)            = delete;
	SessionRegistry& operator=(const SessionRegistry&) = delete;

	bool registerObserver(ISessionObserver* observer); //!< Register a single observer. Returns false if already registered.

	//! Create a session. Solo sessions start active, online sessions wait for activate().
	SessionId create(Participants participants, GameMode mode, std::optional<TimeControl> timeControl);
	ErrorCode activate(const SessionId& sessionId); //!< Waiting -> Active. Blocks until the worker applied it.

	std::shared_ptr<SessionWorker> get(const SessionId& sessionId) const; //!< nullptr if unknown or already removed.

	//! Persist a finished session and schedule its removal. Returns false if unknown, unfinished or already retiring.
	bool retire(const SessionId& sessionId);

	//! Rebuild an unfinished or faulted game from its record under the same id. Recovery tooling only.
	std::optional<SessionId> resume(const GameRecord& record);

	std::vector<SessionId> activeSessionsFor(const UserId& userId) const; //!< Unfinished sessions the user plays in.
	std::size_t size() const;
	void shutdown(); //!< Stop all workers and drop all sessions.

	// ISessionObserver: forwards to the registered observer and retires finished sessions.
	void onSessionUpdated(const SessionId& sessionId, std::shared_ptr<const SessionState> state) override;
	void onActionRejected(const SessionId& sessionId, OriginId origin, ErrorCode code) override;

private:
	SessionId generateSessionId();
	std::shared_ptr<SessionWorker> launch(Session session);
	void remove(const SessionId& sessionId);

private:
	std::shared_ptr<const rules::IRulesEngine> m_rules;
	TimerService& m_timers;
	IPersistenceSink* m_sink{nullptr};
	std::chrono::milliseconds m_retireDelay;

	ISessionObserver* m_observer{nullptr};

	std::string m_salt;                     //!< Random per process.
	std::atomic<std::uint64_t> m_sequence{0};
	std::shared_ptr<char> m_lifetime; //!< Timer callbacks skip once the registry is gone.

	mutable std::mutex m_mutex;
	std::unordered_map<SessionId, std::shared_ptr<SessionWorker>> m_sessions;
	std::unordered_set<SessionId> m_retiring;
	bool m_shutdown{false};
};

} // namespace banchess::engine
