#include "engine/matchmaker.hpp"
#include "logging.hpp"

#include <algorithm>
#include <format>

namespace banchess::engine {

Matchmaker::Matchmaker(SessionRegistry& registry) : m_registry(registry) {
}

EnqueueResult Matchmaker::enqueue(const Identity& identity, std::optional<TimeControl> preferences) {
	const auto key = timeControlKey(preferences);

	std::lock_guard<std::mutex> lock(m_mutex);

	if (const auto it = m_queuedIn.find(identity.userId); it != m_queuedIn.end()) {
		const auto position = positionOf(m_queues[it->second], identity.userId);
		if (it->second != key) {
			return EnqueueResult{.error = ErrorCode::AlreadyQueued, .position = position, .match = std::nullopt};
		}
		return EnqueueResult{.error = ErrorCode::None, .position = position, .match = std::nullopt};
	}
	m_lastMatch.erase(identity.userId);

	auto& queue = m_queues[key];
	if (queue.empty()) {
		queue.push_back(QueueEntry{.identity = identity, .preferences = preferences, .enqueuedAt = std::chrono::system_clock::now()});
		m_queuedIn.emplace(identity.userId, key);

		Logger().Log(Logging::LogLevel::Debug, std::format("[Matchmaker] '{}' waits for a '{}' game.", identity.userId, key));
		return EnqueueResult{.error = ErrorCode::None, .position = queue.size(), .match = std::nullopt};
	}

	// Oldest entry of the class plays white.
	const auto opponent = queue.front();
	queue.pop_front();
	m_queuedIn.erase(opponent.identity.userId);
	if (queue.empty()) {
		m_queues.erase(key);
	}

	Participants participants{.white = opponent.identity, .black = identity};
	const auto sessionId = m_registry.create(participants, GameMode::Online, preferences);
	if (const auto code = m_registry.activate(sessionId); code != ErrorCode::None) {
		Logger().Log(Logging::LogLevel::Error, std::format("[Matchmaker] Could not activate session '{}': {}", sessionId, toString(code)));
	}

	m_lastMatch[opponent.identity.userId] = sessionId;
	m_lastMatch[identity.userId]          = sessionId;

	Logger().Log(Logging::LogLevel::Info,
	             std::format("[Matchmaker] Matched '{}' (white) with '{}' (black) in '{}'.", opponent.identity.userId, identity.userId, sessionId));
	return EnqueueResult{
	        .error    = ErrorCode::None,
	        .position = 0,
	        .match    = Match{.sessionId = sessionId, .participants = std::move(participants), .timeControl = preferences},
	};
}

LeaveResult Matchmaker::leave(const UserId& userId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (const auto it = m_queuedIn.find(userId); it != m_queuedIn.end()) {
		const auto key = it->second;
		m_queuedIn.erase(it);

		auto& queue = m_queues[key];
		std::erase_if(queue, [&](const QueueEntry& entry) { return entry.identity.userId == userId; });
		if (queue.empty()) {
			m_queues.erase(key);
		}
		return LeaveResult{.error = ErrorCode::None, .sessionId = std::nullopt};
	}

	if (const auto it = m_lastMatch.find(userId); it != m_lastMatch.end()) {
		return LeaveResult{.error = ErrorCode::AlreadyMatched, .sessionId = it->second};
	}
	return LeaveResult{.error = ErrorCode::NotQueued, .sessionId = std::nullopt};
}

SessionId Matchmaker::createSolo(const Identity& identity, std::optional<TimeControl> timeControl) {
	return m_registry.create(Participants{.white = identity, .black = identity}, GameMode::Solo, timeControl);
}

std::vector<QueuedIdentity> Matchmaker::positions() const {
	std::lock_guard<std::mutex> lock(m_mutex);

	std::vector<QueuedIdentity> result;
	for (const auto& [key, queue]: m_queues) {
		for (std::size_t i = 0; i < queue.size(); ++i) {
			result.push_back(QueuedIdentity{.identity = queue[i].identity, .position = i + 1});
		}
	}
	return result;
}

void Matchmaker::forget(const SessionId& sessionId) {
	std::lock_guard<std::mutex> lock(m_mutex);
	std::erase_if(m_lastMatch, [&](const auto& entry) { return entry.second == sessionId; });
}

bool Matchmaker::isQueued(const UserId& userId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_queuedIn.contains(userId);
}

std::size_t Matchmaker::positionOf(const std::deque<QueueEntry>& queue, const UserId& userId) const {
	const auto it = std::ranges::find_if(queue, [&](const QueueEntry& entry) { return entry.identity.userId == userId; });
	return it == queue.end() ? 0 : static_cast<std::size_t>(std::distance(queue.begin(), it)) + 1;
}

} // namespace banchess::engine
