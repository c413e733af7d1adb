#include "connectionManager.hpp"

#include <algorithm>

namespace banchess::server {

bool ConnectionManager::add(ConnectionId connectionId) {
	const auto [it, inserted] = m_connections.try_emplace(connectionId, ConnectionContext{.connectionId = connectionId});
	return inserted;
}

void ConnectionManager::remove(ConnectionId connectionId) {
	m_connections.erase(connectionId);
}

ConnectionContext* ConnectionManager::find(ConnectionId connectionId) {
	const auto it = m_connections.find(connectionId);
	return it == m_connections.end() ? nullptr : &it->second;
}

std::vector<ConnectionId> ConnectionManager::attachedTo(const engine::SessionId& sessionId) const {
	std::vector<ConnectionId> result;
	for (const auto& [id, context]: m_connections) {
		if (context.attachedTo == sessionId) {
			result.push_back(id);
		}
	}
	std::ranges::sort(result);
	return result;
}

std::vector<ConnectionId> ConnectionManager::connectionsOf(const engine::UserId& userId) const {
	std::vector<ConnectionId> result;
	for (const auto& [id, context]: m_connections) {
		if (context.identity && context.identity->userId == userId) {
			result.push_back(id);
		}
	}
	std::ranges::sort(result);
	return result;
}

bool ConnectionManager::seatTaken(const engine::SessionId& sessionId, engine::Seat seat, ConnectionId except) const {
	return std::ranges::any_of(m_connections, [&](const auto& entry) {
		const auto& context = entry.second;
		return entry.first != except && context.attachedTo == sessionId && engine::isPlayer(context.seat) &&
		       (context.seat & seat) != engine::Seat::None;
	});
}

std::size_t ConnectionManager::size() const {
	return m_connections.size();
}

} // namespace banchess::server
