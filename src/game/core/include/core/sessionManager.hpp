#pragma once

#include "core/session.hpp"
#include "model/player.hpp"

#include <cstddef>
#include <memory>
#include <mutex>
#include <optional>
#include <random>
#include <unordered_map>

namespace noughts {

//! Arena of live sessions keyed by session id, plus the player -> session membership.
//! \note The arena lock only guards the maps. Game state is guarded by each Session.
class SessionManager {
public:
	SessionManager();

	//! Create a session and bind both players to it. Returns nullptr if a player is already bound to a session.
	std::shared_ptr<Session> create(const PlayerInfo& playerX, const PlayerInfo& playerO);

	std::shared_ptr<Session> find(const SessionId& sessionId) const; //!< Returns nullptr for unknown or removed sessions.
	std::optional<SessionId> sessionOf(PlayerId playerId) const;     //!< Session a player is bound to.

	bool remove(const SessionId& sessionId); //!< Discard session and release membership of both participants.

	std::size_t size() const;

private:
	SessionId generateSessionId(); //!< Random uuid-formatted id. Requires m_mutex.

private:
	mutable std::mutex m_mutex;
	std::unordered_map<SessionId, std::shared_ptr<Session>> m_sessions;
	std::unordered_map<PlayerId, SessionId> m_membership;
	std::mt19937_64 m_random;
};

} // namespace noughts
