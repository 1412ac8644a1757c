#pragma once

#include "core/sessionManager.hpp"
#include "model/player.hpp"

#include <functional>
#include <mutex>
#include <optional>

namespace noughts {

//! Two players joined into a freshly created session.
struct Pairing {
	SessionId sessionId;
	PlayerInfo playerX; //!< The player that was waiting.
	PlayerInfo playerO; //!< The player that just joined.
};

//! Owns the single waiting slot that precedes session creation.
//! Check-empty, set and clear-and-pair happen inside one critical section, so racing joins always pair up.
class Matchmaker {
public:
	using WaitingCallback = std::function<void(const PlayerInfo&)>;
	using PairedCallback  = std::function<void(const Pairing&)>;

	explicit Matchmaker(SessionManager& sessions);

	Matchmaker(const Matchmaker&)            = delete;
	Matchmaker& operator=(const Matchmaker&) = delete;

	//! Pair player with the waiting player, or park it in the slot and return empty.
	//! Callbacks run inside the critical section. Notices queued there precede anything a racing cancel() triggers.
	//! \param onWaiting Invoked when player gets parked.
	//! \param onPaired  Invoked once the session of a new pairing exists.
	std::optional<Pairing> tryPair(const PlayerInfo& player, const WaitingCallback& onWaiting = {}, const PairedCallback& onPaired = {});

	bool cancel(PlayerId playerId);          //!< Empty the slot if it holds playerId. Returns true if it did.
	bool isWaiting(PlayerId playerId) const; //!< True if playerId occupies the slot.
	bool hasWaiting() const;                 //!< True if the slot is occupied.

private:
	SessionManager& m_sessions;

	mutable std::mutex m_mutex;
	std::optional<PlayerInfo> m_waiting; //!< The slot. At most one player.
};

} // namespace noughts
