#include "app/gameHub.hpp"

#include "logging.hpp"

#include <format>
#include <utility>

namespace noughts::app {

using network::ErrorCode;

static constexpr char LOG_REC_JOIN[] = "[GameHub] Received Event 'Join' from connection '{}' as '{}'.";
static constexpr char LOG_REC_MOVE[] = "[GameHub] Received Event 'Move' from '{}' at ({}, {}) in game '{}'.";
static constexpr char LOG_REC_CHAT[] = "[GameHub] Received Event 'Chat' from '{}' in game '{}'.";
static constexpr char LOG_REC_QUIT[] = "[GameHub] Received Event 'Quit' from '{}' in game '{}'.";

static constexpr char MSG_WAITING[]    = "Waiting for an opponent...";
static constexpr char MSG_YOU_LEFT[]   = "You left the game.";
static constexpr char MSG_OTHER_LEFT[] = "{} has left the game.";

static network::ErrorCode toErrorCode(const MoveError error) {
	return error == MoveError::NotYourTurn ? ErrorCode::NotYourTurn : ErrorCode::InvalidMove;
}

static std::string describe(const MoveError error) {
	switch (error) {
	case MoveError::NotYourTurn:
		return "It is not your turn.";
	case MoveError::OutOfBounds:
		return "Position is outside the board.";
	case MoveError::CellOccupied:
		return "Cell is already occupied.";
	case MoveError::None:
		break;
	}
	return {};
}

static network::ServerMoveAck toMoveAck(const SessionSnapshot& snapshot) {
	network::ServerMoveAck ack{
	        .success    = true,
	        .moveNumber = snapshot.moveNumber,
	        .board      = snapshot.board,
	        .nextPlayer = std::nullopt,
	        .winner     = std::nullopt,
	        .code       = std::nullopt,
	        .message    = {},
	};
	if (snapshot.next) {
		ack.nextPlayer = snapshot.next->player.name;
	}
	if (snapshot.status == GameStatus::Won && snapshot.winner) {
		ack.winner = snapshot.winner->player.name;
	} else if (snapshot.status == GameStatus::Draw) {
		ack.winner = network::WINNER_DRAW;
	}
	return ack;
}


GameHub::GameHub(IMessageSink& sink, std::size_t maxConnections)
    : m_matchmaker(m_sessions), m_broadcaster(sink, m_registry), m_sink(sink), m_maxConnections(maxConnections) {
}

void GameHub::onClientConnected(ConnectionId connectionId) {
	const auto count = ++m_connectionCount;
	if (m_maxConnections != 0u && count > m_maxConnections) {
		{
			std::lock_guard<std::mutex> lock(m_refusedMutex);
			m_refused.insert(connectionId);
		}
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameHub] Connection limit of {} reached. Refusing '{}'.", m_maxConnections, connectionId));
		sendError(connectionId, ErrorCode::ServerFull, "Server is full. Try again later.");
		m_sink.close(connectionId);
		return;
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Client '{}' connected.", connectionId));
}

void GameHub::onClientMessage(ConnectionId connectionId, const Message& message) {
	if (isRefused(connectionId)) {
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format("[GameHub] <- '{}': {}", connectionId, message));

	network::ServerError error{};
	const auto event = network::fromClientMessage(message, error);
	if (!event) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameHub] Undecodable message from '{}': {}", connectionId, error.message));
		sendError(connectionId, error.code, error.message);
		return;
	}

	std::visit([&](const auto& e) { handleNetworkEvent(connectionId, e); }, *event);
}

void GameHub::onClientDisconnected(ConnectionId connectionId) {
	--m_connectionCount;
	{
		std::lock_guard<std::mutex> lock(m_refusedMutex);
		if (m_refused.erase(connectionId) != 0u) {
			return;
		}
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Client '{}' disconnected.", connectionId));

	const auto player = m_registry.remove(connectionId);
	if (!player) {
		return;
	}
	if (m_matchmaker.cancel(player->id)) {
		Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Waiting player '{}' left the queue.", player->name));
		return;
	}

	const auto sessionId = m_sessions.sessionOf(player->id);
	if (!sessionId) {
		return;
	}
	if (const auto session = m_sessions.find(*sessionId)) {
		if (const auto result = session->terminate(player->id, TerminateReason::Disconnect)) {
			Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Game '{}' abandoned. '{}' disconnected.", *sessionId, player->name));
			notifySurvivor(*result);
		}
	}
	m_sessions.remove(*sessionId);
}

std::size_t GameHub::activeSessions() const {
	return m_sessions.size();
}

bool GameHub::hasWaitingPlayer() const {
	return m_matchmaker.hasWaiting();
}

void GameHub::handleNetworkEvent(ConnectionId connectionId, const network::ClientJoin& event) {
	if (const auto known = m_registry.byConnection(connectionId)) {
		if (m_matchmaker.isWaiting(known->id) || m_sessions.sessionOf(known->id)) {
			sendError(connectionId, ErrorCode::AlreadyJoined, "You already joined a game.");
			return;
		}
	}

	const auto player = m_registry.add(connectionId, event.username, event.avatar);
	Logger().Log(Logging::LogLevel::Info, std::format(LOG_REC_JOIN, connectionId, player.name));

	const auto onWaiting = [&](const PlayerInfo& waiting) {
		m_broadcaster.send(waiting.id, network::ServerJoinAck{
		                                       .status         = network::JoinStatus::Waiting,
		                                       .message        = MSG_WAITING,
		                                       .gameId         = {},
		                                       .symbol         = std::nullopt,
		                                       .opponent       = {},
		                                       .opponentAvatar = {},
		                               });
	};
	m_matchmaker.tryPair(player, onWaiting, [&](const Pairing& pairing) { announcePairing(pairing); });
}

void GameHub::handleNetworkEvent(ConnectionId connectionId, const network::ClientMove& event) {
	PlayerInfo requester;
	const auto session = resolveSession(connectionId, event.gameId, requester);
	if (!session) {
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REC_MOVE, requester.name, event.position.row, event.position.col, event.gameId));

	const auto result = session->submitMove(requester.id, event.position);
	if (!result.accepted()) {
		auto ack    = toMoveAck(result.snapshot);
		ack.success = false;
		ack.code    = toErrorCode(result.error);
		ack.message = describe(result.error);
		Logger().Log(Logging::LogLevel::Warning, std::format("[GameHub] Rejected move of '{}': {}", requester.name, ack.message));
		m_broadcaster.sendTo(connectionId, ack);
		return;
	}

	// State is a copy taken under the session lock. No lock is held from here on.
	m_broadcaster.broadcast(*session, toMoveAck(result.snapshot));

	const auto& snapshot = result.snapshot;
	if (isTerminal(snapshot.status)) {
		if (snapshot.status == GameStatus::Won && snapshot.winner) {
			Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Game '{}' won by '{}'.", snapshot.id, snapshot.winner->player.name));
		} else {
			Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Game '{}' ended in a draw.", snapshot.id));
		}
		m_sessions.remove(snapshot.id);
	}
}

void GameHub::handleNetworkEvent(ConnectionId connectionId, const network::ClientChat& event) {
	PlayerInfo requester;
	const auto session = resolveSession(connectionId, event.gameId, requester);
	if (!session) {
		return;
	}

	Logger().Log(Logging::LogLevel::Debug, std::format(LOG_REC_CHAT, requester.name, event.gameId));

	const auto line = session->chat(requester.id, event.message);
	if (!line) {
		sendError(connectionId, ErrorCode::InvalidGame, "Game not found.");
		return;
	}
	m_broadcaster.broadcast(*session, network::ServerChatBroadcast{.username = line->sender.player.name, .message = line->text});
}

void GameHub::handleNetworkEvent(ConnectionId connectionId, const network::ClientQuit& event) {
	PlayerInfo requester;
	const auto session = resolveSession(connectionId, event.gameId, requester);
	if (!session) {
		return;
	}

	Logger().Log(Logging::LogLevel::Info, std::format(LOG_REC_QUIT, requester.name, event.gameId));

	const auto result = session->terminate(requester.id, TerminateReason::Quit);
	m_broadcaster.sendTo(connectionId, network::ServerQuitAck{.message = MSG_YOU_LEFT});
	if (result) {
		notifySurvivor(*result);
	}

	m_sessions.remove(session->id());
	m_registry.remove(connectionId);
}

std::shared_ptr<Session> GameHub::resolveSession(ConnectionId connectionId, const SessionId& sessionId, PlayerInfo& requester) {
	const auto player = m_registry.byConnection(connectionId);
	if (!player) {
		sendError(connectionId, ErrorCode::NotInGame, "Join a game first.");
		return nullptr;
	}

	auto session = m_sessions.find(sessionId);
	if (!session) {
		sendError(connectionId, ErrorCode::InvalidGame, "Game not found.");
		return nullptr;
	}
	if (!session->isParticipant(player->id)) {
		sendError(connectionId, ErrorCode::NotInGame, "You are not a player of this game.");
		return nullptr;
	}

	requester = *player;
	return session;
}

void GameHub::announcePairing(const Pairing& pairing) {
	Logger().Log(Logging::LogLevel::Info, std::format("[GameHub] Game '{}' started: '{}' (X) vs '{}' (O).", pairing.sessionId, pairing.playerX.name, pairing.playerO.name));

	// X first. It holds the first turn.
	m_broadcaster.send(pairing.playerX.id, network::ServerJoinAck{
	                                               .status         = network::JoinStatus::Success,
	                                               .message        = {},
	                                               .gameId         = pairing.sessionId,
	                                               .symbol         = Symbol::X,
	                                               .opponent       = pairing.playerO.name,
	                                               .opponentAvatar = pairing.playerO.avatar,
	                                       });
	m_broadcaster.send(pairing.playerO.id, network::ServerJoinAck{
	                                               .status         = network::JoinStatus::Success,
	                                               .message        = {},
	                                               .gameId         = pairing.sessionId,
	                                               .symbol         = Symbol::O,
	                                               .opponent       = pairing.playerX.name,
	                                               .opponentAvatar = pairing.playerX.avatar,
	                                       });
}

void GameHub::notifySurvivor(const TerminateResult& result) {
	m_broadcaster.send(result.survivor.player.id, network::ServerQuitAck{.message = std::format(MSG_OTHER_LEFT, result.leaver.player.name)});
}

void GameHub::sendError(ConnectionId connectionId, network::ErrorCode code, std::string message) {
	m_broadcaster.sendTo(connectionId, network::ServerError{.code = code, .message = std::move(message)});
}

bool GameHub::isRefused(ConnectionId connectionId) const {
	std::lock_guard<std::mutex> lock(m_refusedMutex);
	return m_refused.contains(connectionId);
}

} // namespace noughts::app
