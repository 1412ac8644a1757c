#include "network/nwEvents.hpp"

#include "network/core/protocol.hpp"

#include <nlohmann/json.hpp>

#include <climits>
#include <format>
#include <string_view>

namespace noughts::network {

using nlohmann::json;

static constexpr std::string_view TYPE_JOIN           = "join";
static constexpr std::string_view TYPE_MOVE           = "move";
static constexpr std::string_view TYPE_CHAT           = "chat";
static constexpr std::string_view TYPE_QUIT           = "quit";
static constexpr std::string_view TYPE_JOIN_ACK       = "join_ack";
static constexpr std::string_view TYPE_MOVE_ACK       = "move_ack";
static constexpr std::string_view TYPE_CHAT_BROADCAST = "chat_broadcast";
static constexpr std::string_view TYPE_QUIT_ACK       = "quit_ack";
static constexpr std::string_view TYPE_ERROR          = "error";

static constexpr std::string_view STATUS_SUCCESS = "success";
static constexpr std::string_view STATUS_FAILURE = "failure";
static constexpr std::string_view STATUS_WAITING = "waiting";

static std::string envelope(std::string_view type, json data) {
	return json{{"type", type}, {"data", std::move(data)}}.dump();
}

static std::optional<std::string> getString(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_string()) {
		return std::nullopt;
	}
	return it->get<std::string>();
}

static std::optional<unsigned> getUnsigned(const json& j, const char* key) {
	const auto it = j.find(key);
	if (it == j.end() || !it->is_number_unsigned()) {
		return std::nullopt;
	}
	return it->get<unsigned>();
}

//! Clamp to int. Anything outside int range is out of bounds anyway.
static int toIndex(const json& value) {
	const auto parsed = value.get<long long>();
	if (parsed < INT_MIN || parsed > INT_MAX) {
		return -1;
	}
	return static_cast<int>(parsed);
}

static json toJson(const Board& board) {
	auto rows = json::array();
	for (int row = 0; row != static_cast<int>(Board::SIZE); ++row) {
		auto cells = json::array();
		for (int col = 0; col != static_cast<int>(Board::SIZE); ++col) {
			switch (board.get({row, col})) {
			case Board::Cell::Empty:
				cells.push_back("");
				break;
			case Board::Cell::X:
				cells.push_back("X");
				break;
			case Board::Cell::O:
				cells.push_back("O");
				break;
			}
		}
		rows.push_back(std::move(cells));
	}
	return rows;
}

static std::optional<Board> boardFromJson(const json& j) {
	if (!j.is_array() || j.size() != Board::SIZE) {
		return std::nullopt;
	}

	Board board;
	for (int row = 0; row != static_cast<int>(Board::SIZE); ++row) {
		const auto& cells = j[static_cast<std::size_t>(row)];
		if (!cells.is_array() || cells.size() != Board::SIZE) {
			return std::nullopt;
		}
		for (int col = 0; col != static_cast<int>(Board::SIZE); ++col) {
			const auto& cell = cells[static_cast<std::size_t>(col)];
			if (!cell.is_string()) {
				return std::nullopt;
			}
			const auto value = cell.get<std::string>();
			if (value.empty()) {
				continue;
			}
			if (value != "X" && value != "O") {
				return std::nullopt;
			}
			if (!board.place({row, col}, value == "X" ? Board::Cell::X : Board::Cell::O)) {
				return std::nullopt;
			}
		}
	}
	return board;
}

static json nullableString(const std::optional<std::string>& value) {
	return value ? json(*value) : json(nullptr);
}

// Client -> server

static std::string toMessage(const ClientJoin& e) {
	json data{{"username", e.username}};
	if (!e.avatar.empty()) {
		data["avatar"] = e.avatar;
	}
	return envelope(TYPE_JOIN, std::move(data));
}
static std::string toMessage(const ClientMove& e) {
	return envelope(TYPE_MOVE, {{"game_id", e.gameId}, {"position", json::array({e.position.row, e.position.col})}});
}
static std::string toMessage(const ClientChat& e) {
	return envelope(TYPE_CHAT, {{"game_id", e.gameId}, {"message", e.message}});
}
static std::string toMessage(const ClientQuit& e) {
	return envelope(TYPE_QUIT, {{"game_id", e.gameId}});
}

std::string toMessage(ClientEvent event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

static std::optional<ClientEvent> parseJoin(const json& data, ServerError& error) {
	ClientJoin join{};
	if (data.contains("username") && !data["username"].is_null()) {
		const auto username = getString(data, "username");
		if (!username) {
			error = {ErrorCode::MissingData, "Username must be a string."};
			return std::nullopt;
		}
		if (username->size() > core::MAX_USERNAME_BYTES) {
			error = {ErrorCode::MissingData, std::format("Username must not exceed {} bytes.", core::MAX_USERNAME_BYTES)};
			return std::nullopt;
		}
		join.username = *username;
	}
	if (data.contains("avatar") && !data["avatar"].is_null()) {
		const auto avatar = getString(data, "avatar");
		if (!avatar) {
			error = {ErrorCode::MissingData, "Avatar must be a string."};
			return std::nullopt;
		}
		if (avatar->size() > core::MAX_AVATAR_BYTES) {
			error = {ErrorCode::MissingData, std::format("Avatar must not exceed {} bytes.", core::MAX_AVATAR_BYTES)};
			return std::nullopt;
		}
		join.avatar = *avatar;
	}
	return join;
}

static std::optional<ClientEvent> parseMove(const json& data, ServerError& error) {
	const auto gameId   = getString(data, "game_id");
	const auto position = data.find("position");
	if (!gameId || gameId->empty() || position == data.end() || !position->is_array() || position->size() != 2u || !(*position)[0].is_number_integer() ||
	    !(*position)[1].is_number_integer()) {
		error = {ErrorCode::MissingData, "Game ID and position are required."};
		return std::nullopt;
	}
	return ClientMove{.gameId = *gameId, .position = {toIndex((*position)[0]), toIndex((*position)[1])}};
}

static std::optional<ClientEvent> parseChat(const json& data, ServerError& error) {
	const auto gameId  = getString(data, "game_id");
	const auto message = getString(data, "message");
	if (!gameId || gameId->empty() || !message || message->empty()) {
		error = {ErrorCode::MissingData, "Game ID and message are required."};
		return std::nullopt;
	}
	if (message->size() > core::MAX_CHAT_BYTES) {
		error = {ErrorCode::MissingData, std::format("Message must not exceed {} bytes.", core::MAX_CHAT_BYTES)};
		return std::nullopt;
	}
	return ClientChat{.gameId = *gameId, .message = *message};
}

static std::optional<ClientEvent> parseQuit(const json& data, ServerError& error) {
	const auto gameId = getString(data, "game_id");
	if (!gameId || gameId->empty()) {
		error = {ErrorCode::MissingData, "Game ID is required."};
		return std::nullopt;
	}
	return ClientQuit{.gameId = *gameId};
}

std::optional<ClientEvent> fromClientMessage(const std::string& message, ServerError& error) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		error = {ErrorCode::InvalidJson, "Invalid JSON format."};
		return std::nullopt;
	}

	const auto type = getString(j, "type");
	if (!type) {
		error = {ErrorCode::UnknownType, "Unknown message type."};
		return std::nullopt;
	}

	// A missing data object reads as empty. Required fields are checked per type.
	static const json EMPTY = json::object();
	const auto dataIt       = j.find("data");
	if (dataIt != j.end() && !dataIt->is_object() && !dataIt->is_null()) {
		error = {ErrorCode::MissingData, "Message data must be an object."};
		return std::nullopt;
	}
	const auto& data = (dataIt == j.end() || dataIt->is_null()) ? EMPTY : *dataIt;

	if (*type == TYPE_JOIN) {
		return parseJoin(data, error);
	}
	if (*type == TYPE_MOVE) {
		return parseMove(data, error);
	}
	if (*type == TYPE_CHAT) {
		return parseChat(data, error);
	}
	if (*type == TYPE_QUIT) {
		return parseQuit(data, error);
	}

	error = {ErrorCode::UnknownType, "Unknown message type."};
	return std::nullopt;
}

std::optional<ClientEvent> fromClientMessage(const std::string& message) {
	ServerError ignored{};
	return fromClientMessage(message, ignored);
}

// Server -> client

static std::string toMessage(const ServerJoinAck& e) {
	if (e.status == JoinStatus::Waiting) {
		return envelope(TYPE_JOIN_ACK, {{"status", STATUS_WAITING}, {"message", e.message}});
	}

	json data{
	        {"status", STATUS_SUCCESS},
	        {"game_id", e.gameId},
	        {"player_symbol", std::string(1, toChar(e.symbol.value_or(Symbol::X)))},
	        {"opponent", e.opponent},
	};
	if (!e.opponentAvatar.empty()) {
		data["opponent_avatar"] = e.opponentAvatar;
	}
	return envelope(TYPE_JOIN_ACK, std::move(data));
}

static std::string toMessage(const ServerMoveAck& e) {
	json data{
	        {"status", e.success ? STATUS_SUCCESS : STATUS_FAILURE},
	        {"move_number", e.moveNumber},
	        {"game_state", toJson(e.board)},
	        {"next_player", nullableString(e.nextPlayer)},
	        {"winner", nullableString(e.winner)},
	};
	if (!e.success) {
		data["code"]    = toString(e.code.value_or(ErrorCode::InvalidMove));
		data["message"] = e.message;
	}
	return envelope(TYPE_MOVE_ACK, std::move(data));
}

static std::string toMessage(const ServerChatBroadcast& e) {
	return envelope(TYPE_CHAT_BROADCAST, {{"username", e.username}, {"message", e.message}});
}

static std::string toMessage(const ServerQuitAck& e) {
	return envelope(TYPE_QUIT_ACK, {{"status", STATUS_SUCCESS}, {"message", e.message}});
}

static std::string toMessage(const ServerError& e) {
	return envelope(TYPE_ERROR, {{"code", toString(e.code)}, {"message", e.message}});
}

std::string toMessage(ServerEvent event) {
	return std::visit([&](auto&& ev) { return toMessage(ev); }, event);
}

static std::optional<ServerEvent> parseJoinAck(const json& data) {
	const auto status = getString(data, "status");
	if (!status) {
		return std::nullopt;
	}
	if (*status == STATUS_WAITING) {
		return ServerJoinAck{.status = JoinStatus::Waiting, .message = getString(data, "message").value_or(""), .gameId = {}, .symbol = {}, .opponent = {}, .opponentAvatar = {}};
	}
	if (*status != STATUS_SUCCESS) {
		return std::nullopt;
	}

	const auto gameId = getString(data, "game_id");
	const auto symbol = getString(data, "player_symbol");
	if (!gameId || !symbol || (*symbol != "X" && *symbol != "O")) {
		return std::nullopt;
	}
	return ServerJoinAck{
	        .status         = JoinStatus::Success,
	        .message        = getString(data, "message").value_or(""),
	        .gameId         = *gameId,
	        .symbol         = *symbol == "X" ? Symbol::X : Symbol::O,
	        .opponent       = getString(data, "opponent").value_or(""),
	        .opponentAvatar = getString(data, "opponent_avatar").value_or(""),
	};
}

static std::optional<ServerEvent> parseMoveAck(const json& data) {
	const auto status = getString(data, "status");
	if (!status || (*status != STATUS_SUCCESS && *status != STATUS_FAILURE)) {
		return std::nullopt;
	}

	ServerMoveAck ack{
	        .success    = *status == STATUS_SUCCESS,
	        .moveNumber = getUnsigned(data, "move_number").value_or(0u),
	        .board      = {},
	        .nextPlayer = getString(data, "next_player"),
	        .winner     = getString(data, "winner"),
	        .code       = std::nullopt,
	        .message    = getString(data, "message").value_or(""),
	};

	if (const auto it = data.find("game_state"); it != data.end()) {
		const auto board = boardFromJson(*it);
		if (!board) {
			return std::nullopt;
		}
		ack.board = *board;
	} else if (ack.success) {
		return std::nullopt;
	}

	if (!ack.success) {
		const auto code = getString(data, "code");
		ack.code        = code ? errorCodeFromString(*code) : std::nullopt;
	}
	return ack;
}

static std::optional<ServerEvent> parseChatBroadcast(const json& data) {
	const auto username = getString(data, "username");
	const auto message  = getString(data, "message");
	if (!username || !message) {
		return std::nullopt;
	}
	return ServerChatBroadcast{.username = *username, .message = *message};
}

static std::optional<ServerEvent> parseQuitAck(const json& data) {
	const auto message = getString(data, "message");
	if (!message) {
		return std::nullopt;
	}
	return ServerQuitAck{.message = *message};
}

static std::optional<ServerEvent> parseError(const json& data) {
	const auto codeName = getString(data, "code");
	if (!codeName) {
		return std::nullopt;
	}
	const auto code = errorCodeFromString(*codeName);
	if (!code) {
		return std::nullopt;
	}
	return ServerError{.code = *code, .message = getString(data, "message").value_or("")};
}

std::optional<ServerEvent> fromServerMessage(const std::string& message) {
	const auto j = json::parse(message, nullptr, false);
	if (j.is_discarded() || !j.is_object()) {
		return std::nullopt;
	}

	const auto type   = getString(j, "type");
	const auto dataIt = j.find("data");
	if (!type || dataIt == j.end() || !dataIt->is_object()) {
		return std::nullopt;
	}

	if (*type == TYPE_JOIN_ACK) {
		return parseJoinAck(*dataIt);
	}
	if (*type == TYPE_MOVE_ACK) {
		return parseMoveAck(*dataIt);
	}
	if (*type == TYPE_CHAT_BROADCAST) {
		return parseChatBroadcast(*dataIt);
	}
	if (*type == TYPE_QUIT_ACK) {
		return parseQuitAck(*dataIt);
	}
	if (*type == TYPE_ERROR) {
		return parseError(*dataIt);
	}
	return std::nullopt;
}

} // namespace noughts::network
