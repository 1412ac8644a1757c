#pragma once

#include "model/player.hpp"

#include <cstddef>
#include <mutex>
#include <optional>
#include <random>
#include <string>
#include <unordered_map>

namespace noughts {

//! Hands out player identities and remembers which connection each player talks through.
//! \note Thread safe. Identity is independent of matchmaking and session membership.
class PlayerRegistry {
public:
	PlayerRegistry();

	//! Register the player behind a connection. Replaces an earlier registration of the same connection.
	//! An empty name is replaced by a generated "Player_<suffix>" name.
	PlayerInfo add(ConnectionHandle connection, std::string name, std::string avatar = {});

	std::optional<PlayerInfo> remove(ConnectionHandle connection); //!< Forget the player behind a connection.

	std::optional<PlayerInfo> byConnection(ConnectionHandle connection) const;
	std::optional<ConnectionHandle> connectionOf(PlayerId playerId) const;

	std::size_t size() const;

private:
	std::string generateName(); //!< Requires m_mutex.

private:
	mutable std::mutex m_mutex;
	PlayerId m_nextPlayerId{1u};
	std::unordered_map<ConnectionHandle, PlayerInfo> m_players;
	std::unordered_map<PlayerId, ConnectionHandle> m_connections;
	std::mt19937 m_random;
};

} // namespace noughts
