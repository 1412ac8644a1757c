#include "core/matchmaker.hpp"

#include <utility>

namespace noughts {

Matchmaker::Matchmaker(SessionManager& sessions) : m_sessions(sessions) {
}

std::optional<Pairing> Matchmaker::tryPair(const PlayerInfo& player, const WaitingCallback& onWaiting, const PairedCallback& onPaired) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_waiting && m_waiting->id != player.id) {
		// Session creation binds membership before the slot lock is released.
		// A disconnect cancelling the waiting player therefore either wins the slot or finds the session.
		const auto session = m_sessions.create(*m_waiting, player);
		if (session) {
			Pairing pairing{.sessionId = session->id(), .playerX = std::move(*m_waiting), .playerO = player};
			m_waiting.reset();
			if (onPaired) {
				onPaired(pairing);
			}
			return pairing;
		}
	}

	m_waiting = player;
	if (onWaiting) {
		onWaiting(player);
	}
	return std::nullopt;
}

bool Matchmaker::cancel(PlayerId playerId) {
	std::lock_guard<std::mutex> lock(m_mutex);

	if (m_waiting && m_waiting->id == playerId) {
		m_waiting.reset();
		return true;
	}
	return false;
}

bool Matchmaker::isWaiting(PlayerId playerId) const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_waiting && m_waiting->id == playerId;
}

bool Matchmaker::hasWaiting() const {
	std::lock_guard<std::mutex> lock(m_mutex);
	return m_waiting.has_value();
}

} // namespace noughts
