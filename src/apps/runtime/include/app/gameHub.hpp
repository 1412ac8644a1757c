#pragma once

#include "app/broadcaster.hpp"
#include "app/messageSink.hpp"
#include "core/matchmaker.hpp"
#include "core/playerRegistry.hpp"
#include "core/sessionManager.hpp"
#include "network/nwEvents.hpp"

#include <atomic>
#include <cstddef>
#include <mutex>
#include <unordered_set>

namespace noughts::app {

//! Dispatches decoded client requests to matchmaking and sessions, and answers through the message sink.
//! \note Transport independent. Calls for one connection must not overlap, calls for different connections may run in parallel.
class GameHub {
public:
	GameHub(IMessageSink& sink, std::size_t maxConnections);

	GameHub(const GameHub&)            = delete;
	GameHub& operator=(const GameHub&) = delete;

	void onClientConnected(ConnectionId connectionId);
	void onClientMessage(ConnectionId connectionId, const Message& message);
	void onClientDisconnected(ConnectionId connectionId);

	std::size_t activeSessions() const; //!< Sessions currently in the arena.
	bool hasWaitingPlayer() const;      //!< True if someone occupies the matchmaking slot.

private:
	// Processing of the decoded client requests.
	void handleNetworkEvent(ConnectionId connectionId, const network::ClientJoin& event);
	void handleNetworkEvent(ConnectionId connectionId, const network::ClientMove& event);
	void handleNetworkEvent(ConnectionId connectionId, const network::ClientChat& event);
	void handleNetworkEvent(ConnectionId connectionId, const network::ClientQuit& event);

	//! Resolve requester and session of a game request. Answers with an error and returns nullptr on failure.
	std::shared_ptr<Session> resolveSession(ConnectionId connectionId, const SessionId& sessionId, PlayerInfo& requester);

	void announcePairing(const Pairing& pairing);
	void notifySurvivor(const TerminateResult& result); //!< Tell the remaining participant the opponent left.
	void sendError(ConnectionId connectionId, network::ErrorCode code, std::string message);

	bool isRefused(ConnectionId connectionId) const;

private:
	PlayerRegistry m_registry;
	SessionManager m_sessions;
	Matchmaker m_matchmaker;
	Broadcaster m_broadcaster;
	IMessageSink& m_sink;

	const std::size_t m_maxConnections;
	std::atomic<std::size_t> m_connectionCount{0u};

	mutable std::mutex m_refusedMutex;
	std::unordered_set<ConnectionId> m_refused; //!< Connections over the limit. Waiting for close.
};

} // namespace noughts::app
