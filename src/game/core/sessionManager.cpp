#include "core/sessionManager.hpp"

#include <format>

namespace noughts {

SessionManager::SessionManager() : m_random(std::random_device{}()) {
}

std::shared_ptr<Session> SessionManager::create(const PlayerInfo& playerX, const PlayerInfo& playerO) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (playerX.id == playerO.id || m_membership.contains(playerX.id) || m_membership.contains(playerO.id)) {
		return nullptr;
	}

	auto sessionId = generateSessionId();
	while (m_sessions.contains(sessionId)) {
		sessionId = generateSessionId();
	}

	auto session = std::make_shared<Session>(sessionId, playerX, playerO);
	m_sessions.emplace(sessionId, session);
	m_membership.emplace(playerX.id, sessionId);
	m_membership.emplace(playerO.id, sessionId);
	return session;
}

std::shared_ptr<Session> SessionManager::find(const SessionId& sessionId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return nullptr;
	}
	return it->second;
}

std::optional<SessionId> SessionManager::sessionOf(PlayerId playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_membership.find(playerId);
	if (it == m_membership.end()) {
		return std::nullopt;
	}
	return it->second;
}

bool SessionManager::remove(const SessionId& sessionId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_sessions.find(sessionId);
	if (it == m_sessions.end()) {
		return false;
	}

	for (const auto& participant: {it->second->playerX(), it->second->playerO()}) {
		const auto member = m_membership.find(participant.player.id);
		if (member != m_membership.end() && member->second == sessionId) {
			m_membership.erase(member);
		}
	}
	m_sessions.erase(it);
	return true;
}

std::size_t SessionManager::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_sessions.size();
}

SessionId SessionManager::generateSessionId() {
	// Version 4 layout: 8-4-4-4-12 hex digits.
	const auto high = m_random();
	const auto low  = m_random();
	return std::format("{:08x}-{:04x}-4{:03x}-{:x}{:03x}-{:012x}", high >> 32, (high >> 16) & 0xFFFFu, high & 0xFFFu, 0x8u | ((low >> 60) & 0x3u),
	                   (low >> 48) & 0xFFFu, low & 0xFFFFFFFFFFFFull);
}

} // namespace noughts
