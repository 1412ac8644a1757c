#include "core/playerRegistry.hpp"

#include <format>
#include <utility>

namespace noughts {

static constexpr char DEFAULT_NAME_PREFIX[] = "Player_";

PlayerRegistry::PlayerRegistry() : m_random(std::random_device{}()) {
}

PlayerInfo PlayerRegistry::add(ConnectionHandle connection, std::string name, std::string avatar) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (const auto it = m_players.find(connection); it != m_players.end()) {
		m_connections.erase(it->second.id);
		m_players.erase(it);
	}

	PlayerInfo info{
	        .id     = m_nextPlayerId++,
	        .name   = name.empty() ? generateName() : std::move(name),
	        .avatar = std::move(avatar),
	};
	if (m_nextPlayerId == 0u) {
		m_nextPlayerId = 1u;
	}

	m_players.emplace(connection, info);
	m_connections.emplace(info.id, connection);
	return info;
}

std::optional<PlayerInfo> PlayerRegistry::remove(ConnectionHandle connection) {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_players.find(connection);
	if (it == m_players.end()) {
		return std::nullopt;
	}
	auto info = std::move(it->second);
	m_connections.erase(info.id);
	m_players.erase(it);
	return info;
}

std::optional<PlayerInfo> PlayerRegistry::byConnection(ConnectionHandle connection) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_players.find(connection);
	if (it == m_players.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::optional<ConnectionHandle> PlayerRegistry::connectionOf(PlayerId playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);

	const auto it = m_connections.find(playerId);
	if (it == m_connections.end()) {
		return std::nullopt;
	}
	return it->second;
}

std::size_t PlayerRegistry::size() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_players.size();
}

std::string PlayerRegistry::generateName() {
	std::uniform_int_distribution<unsigned> digits(0u, 0xFFFFFFu);
	return std::format("{}{:06x}", DEFAULT_NAME_PREFIX, digits(m_random));
}

} // namespace noughts
