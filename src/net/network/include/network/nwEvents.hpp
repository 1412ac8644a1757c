#pragma once

#include "model/board.hpp"
#include "model/coordinate.hpp"
#include "model/symbol.hpp"
#include "network/types.hpp"

#include <optional>
#include <string>
#include <variant>

namespace noughts::network {

// Client Network Events (client -> server)
struct ClientJoin {
	std::string username; //!< Empty lets the server pick a name.
	std::string avatar;   //!< Optional. Empty if none.
};
struct ClientMove {
	SessionId gameId;
	Coord position;
};
struct ClientChat {
	SessionId gameId;
	std::string message;
};
struct ClientQuit {
	SessionId gameId;
};

// Server Events (server -> client)
struct ServerJoinAck {
	JoinStatus status;
	std::string message;          //!< Human readable note. Set while waiting.
	SessionId gameId;             //!< Set on success.
	std::optional<Symbol> symbol; //!< Symbol assigned to the receiver. Set on success.
	std::string opponent;         //!< Opponent display name. Set on success.
	std::string opponentAvatar;   //!< Opponent avatar. Empty if none.
};

//! Board update after a move request. Broadcast on success, sent to the requester on failure.
struct ServerMoveAck {
	bool success;
	unsigned moveNumber;                   //!< Accepted moves so far. Clients drop updates older than what they have.
	Board board;                           //!< Full board after the request.
	std::optional<std::string> nextPlayer; //!< Name of the player to move. Empty once the game is over.
	std::optional<std::string> winner;     //!< Winner name, WINNER_DRAW, or empty while the game runs.
	std::optional<ErrorCode> code;         //!< Reason of a failure.
	std::string message;                   //!< Human readable reason of a failure.
};

struct ServerChatBroadcast {
	std::string username; //!< Sender display name.
	std::string message;
};

//! Sent to a quitting player and, as notice, to its opponent.
struct ServerQuitAck {
	std::string message;
};

struct ServerError {
	ErrorCode code;
	std::string message;
};


using ClientEvent = std::variant<ClientJoin, ClientMove, ClientChat, ClientQuit>;
using ServerEvent = std::variant<ServerJoinAck, ServerMoveAck, ServerChatBroadcast, ServerQuitAck, ServerError>;

// Serialize typed events to JSON messages of the form {"type": ..., "data": {...}}.
std::string toMessage(ClientEvent event);
std::string toMessage(ServerEvent event);

// Parse JSON messages into typed events. Returns empty on invalid input.
std::optional<ClientEvent> fromClientMessage(const std::string& message);
std::optional<ClientEvent> fromClientMessage(const std::string& message, ServerError& error); //!< Also reports why decoding failed.
std::optional<ServerEvent> fromServerMessage(const std::string& message);

} // namespace noughts::network
