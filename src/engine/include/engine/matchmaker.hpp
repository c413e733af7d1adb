#pragma once

#include "engine/sessionRegistry.hpp"
#include "engine/types.hpp"

#include <deque>
#include <map>
#include <mutex>
#include <optional>
#include <string>
#include <unordered_map>
#include <vector>

namespace banchess::engine {

struct QueueEntry {
	Identity identity;
	std::optional<TimeControl> preferences; //!< Empty for untimed games.
	SystemTime enqueuedAt{};
};

struct Match {
	SessionId sessionId;
	Participants participants; //!< First enqueued plays white.
	std::optional<TimeControl> timeControl;
};

struct EnqueueResult {
	ErrorCode error{ErrorCode::None}; //!< AlreadyQueued if the identity waits with other preferences.
	std::size_t position{0};          //!< 1-based position in its preference class. 0 when matched.
	std::optional<Match> match;       //!< Set when the entry was paired.
};

struct LeaveResult {
	ErrorCode error{ErrorCode::None};   //!< None when left, AlreadyMatched or NotQueued otherwise.
	std::optional<SessionId> sessionId; //!< Session of an earlier match.
};

struct QueuedIdentity {
	Identity identity;
	std::size_t position{0};
};

//! FIFO pairing per preference class. Pairing and leaving are serialised by one mutex so an entry is matched or left, never both.
class Matchmaker {
public:
	explicit Matchmaker(SessionRegistry& registry);

	EnqueueResult enqueue(const Identity& identity, std::optional<TimeControl> preferences);
	LeaveResult leave(const UserId& userId);

	SessionId createSolo(const Identity& identity, std::optional<TimeControl> timeControl); //!< Bypasses the queue.

	std::vector<QueuedIdentity> positions() const; //!< Every waiting identity with its position in its class.
	bool isQueued(const UserId& userId) const;
	void forget(const SessionId& sessionId); //!< Drop the match record of a removed session.

private:
	std::size_t positionOf(const std::deque<QueueEntry>& queue, const UserId& userId) const;

private:
	SessionRegistry& m_registry;

	mutable std::mutex m_mutex;
	std::map<std::string, std::deque<QueueEntry>> m_queues;     //!< Preference class -> waiting entries.
	std::unordered_map<UserId, std::string> m_queuedIn;         //!< User -> preference class.
	std::unordered_map<UserId, SessionId> m_lastMatch;          //!< Answers leave requests that lost against a match.
};

} // namespace banchess::engine
