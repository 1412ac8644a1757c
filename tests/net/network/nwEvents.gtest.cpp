#include "network/core/protocol.hpp"
#include "network/nwEvents.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>
#include <optional>
#include <string>

namespace noughts::gtest {

using nlohmann::json;

static network::ServerError decodeError(const std::string& message) {
	network::ServerError error{.code = network::ErrorCode::Count, .message = {}};
	EXPECT_FALSE(network::fromClientMessage(message, error).has_value()) << message;
	return error;
}

TEST(GameNetMessages, ClientToMessage) {
	EXPECT_EQ(json::parse(network::toMessage(network::ClientJoin{.username = "alice", .avatar = {}})), json({{"type", "join"}, {"data", {{"username", "alice"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientJoin{.username = "alice", .avatar = "owl"})),
	          json({{"type", "join"}, {"data", {{"username", "alice"}, {"avatar", "owl"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientMove{.gameId = "g", .position = {1, 2}})),
	          json({{"type", "move"}, {"data", {{"game_id", "g"}, {"position", json::array({1, 2})}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientChat{.gameId = "g", .message = "hello"})),
	          json({{"type", "chat"}, {"data", {{"game_id", "g"}, {"message", "hello"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ClientQuit{.gameId = "g"})), json({{"type", "quit"}, {"data", {{"game_id", "g"}}}}));
}

TEST(GameNetMessages, ClientFromMessageValid) {
	const auto join = network::fromClientMessage(R"({"type":"join","data":{"username":"alice","avatar":"owl"}})");
	ASSERT_TRUE(join.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientJoin>(*join));
	EXPECT_EQ(std::get<network::ClientJoin>(*join).username, "alice");
	EXPECT_EQ(std::get<network::ClientJoin>(*join).avatar, "owl");

	// Server picks a name when none is given.
	const auto anonymous = network::fromClientMessage(R"({"type":"join"})");
	ASSERT_TRUE(anonymous.has_value());
	EXPECT_TRUE(std::get<network::ClientJoin>(*anonymous).username.empty());

	const auto move = network::fromClientMessage(R"({"type":"move","data":{"game_id":"g-1","position":[2,0]}})");
	ASSERT_TRUE(move.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientMove>(*move));
	const auto moveEvent = std::get<network::ClientMove>(*move);
	EXPECT_EQ(moveEvent.gameId, "g-1");
	EXPECT_EQ(moveEvent.position, (Coord{2, 0}));

	// Range is checked by the rules, not the decoder.
	const auto outside = network::fromClientMessage(R"({"type":"move","data":{"game_id":"g-1","position":[7,-1]}})");
	ASSERT_TRUE(outside.has_value());
	EXPECT_EQ(std::get<network::ClientMove>(*outside).position, (Coord{7, -1}));

	const auto chat = network::fromClientMessage(R"({"type":"chat","data":{"game_id":"g-1","message":"hello"}})");
	ASSERT_TRUE(chat.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientChat>(*chat));
	EXPECT_EQ(std::get<network::ClientChat>(*chat).message, "hello");

	const auto quit = network::fromClientMessage(R"({"type":"quit","data":{"game_id":"g-1"}})");
	ASSERT_TRUE(quit.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ClientQuit>(*quit));
	EXPECT_EQ(std::get<network::ClientQuit>(*quit).gameId, "g-1");
}

TEST(GameNetMessages, ClientFromMessageInvalid) {
	EXPECT_EQ(decodeError("not-json").code, network::ErrorCode::InvalidJson);
	EXPECT_EQ(decodeError(R"([1,2,3])").code, network::ErrorCode::InvalidJson);
	EXPECT_EQ(decodeError(R"({"type":"join")").code, network::ErrorCode::InvalidJson);

	EXPECT_EQ(decodeError(R"({"data":{}})").code, network::ErrorCode::UnknownType);
	EXPECT_EQ(decodeError(R"({"type":7})").code, network::ErrorCode::UnknownType);
	EXPECT_EQ(decodeError(R"({"type":"resign","data":{}})").code, network::ErrorCode::UnknownType);

	EXPECT_EQ(decodeError(R"({"type":"move","data":{"game_id":"g"}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"move","data":{"position":[0,0]}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"move","data":{"game_id":"g","position":[0]}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"move","data":{"game_id":"g","position":["0","1"]}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"move","data":{"game_id":"g","position":[0.5,1]}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"chat","data":{"game_id":"g"}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"chat","data":{"game_id":"g","message":""}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"quit","data":{}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"join","data":{"username":5}})").code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(R"({"type":"join","data":"alice"})").code, network::ErrorCode::MissingData);

	EXPECT_FALSE(decodeError("not-json").message.empty());
}

TEST(GameNetMessages, ClientTextLimits) {
	using network::core::MAX_AVATAR_BYTES;
	using network::core::MAX_CHAT_BYTES;
	using network::core::MAX_USERNAME_BYTES;

	const auto joinWith = [](const std::string& name, const std::string& avatar) {
		return json({{"type", "join"}, {"data", {{"username", name}, {"avatar", avatar}}}}).dump();
	};
	const auto chatWith = [](const std::string& text) {
		return json({{"type", "chat"}, {"data", {{"game_id", "g"}, {"message", text}}}}).dump();
	};

	const auto longest = network::fromClientMessage(joinWith(std::string(MAX_USERNAME_BYTES, 'a'), std::string(MAX_AVATAR_BYTES, 'b')));
	ASSERT_TRUE(longest.has_value());
	EXPECT_EQ(std::get<network::ClientJoin>(*longest).username.size(), MAX_USERNAME_BYTES);
	EXPECT_TRUE(network::fromClientMessage(chatWith(std::string(MAX_CHAT_BYTES, 'c'))).has_value());

	EXPECT_EQ(decodeError(joinWith(std::string(MAX_USERNAME_BYTES + 1, 'a'), "")).code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(joinWith("alice", std::string(MAX_AVATAR_BYTES + 1, 'b'))).code, network::ErrorCode::MissingData);
	EXPECT_EQ(decodeError(chatWith(std::string(MAX_CHAT_BYTES + 1, 'c'))).code, network::ErrorCode::MissingData);
}

TEST(GameNetMessages, LargestRepliesFitFrame) {
	using network::core::MAX_PAYLOAD_BYTES;

	// Control characters take six bytes each once escaped.
	const std::string name(network::core::MAX_USERNAME_BYTES, '\x01');
	const std::string avatar(network::core::MAX_AVATAR_BYTES, '\x01');
	const std::string text(network::core::MAX_CHAT_BYTES, '\x01');
	const std::string gameId = "00000000-0000-4000-8000-000000000000";

	const auto joinAck = network::toMessage(network::ServerJoinAck{
	        .status         = network::JoinStatus::Success,
	        .message        = {},
	        .gameId         = gameId,
	        .symbol         = Symbol::O,
	        .opponent       = name,
	        .opponentAvatar = avatar,
	});
	EXPECT_LT(joinAck.size(), MAX_PAYLOAD_BYTES);

	const auto moveAck = network::toMessage(network::ServerMoveAck{
	        .success    = false,
	        .moveNumber = 9u,
	        .board      = Board{},
	        .nextPlayer = name,
	        .winner     = name,
	        .code       = network::ErrorCode::NotYourTurn,
	        .message    = "It is not your turn.",
	});
	EXPECT_LT(moveAck.size(), MAX_PAYLOAD_BYTES);

	const auto chat = network::toMessage(network::ServerChatBroadcast{.username = name, .message = text});
	EXPECT_LT(chat.size(), MAX_PAYLOAD_BYTES);
	EXPECT_EQ(json::parse(chat)["data"]["message"].get<std::string>(), text);

	const auto notice = network::toMessage(network::ServerQuitAck{.message = name + " has left the game."});
	EXPECT_LT(notice.size(), MAX_PAYLOAD_BYTES);
}

TEST(GameNetMessages, ServerToMessage) {
	EXPECT_EQ(json::parse(network::toMessage(network::ServerJoinAck{
	                  .status         = network::JoinStatus::Waiting,
	                  .message        = "Waiting for an opponent...",
	                  .gameId         = {},
	                  .symbol         = std::nullopt,
	                  .opponent       = {},
	                  .opponentAvatar = {},
	          })),
	          json({{"type", "join_ack"}, {"data", {{"status", "waiting"}, {"message", "Waiting for an opponent..."}}}}));

	EXPECT_EQ(json::parse(network::toMessage(network::ServerJoinAck{
	                  .status         = network::JoinStatus::Success,
	                  .message        = {},
	                  .gameId         = "g-1",
	                  .symbol         = Symbol::O,
	                  .opponent       = "alice",
	                  .opponentAvatar = "owl",
	          })),
	          json({{"type", "join_ack"},
	                {"data", {{"status", "success"}, {"game_id", "g-1"}, {"player_symbol", "O"}, {"opponent", "alice"}, {"opponent_avatar", "owl"}}}}));

	Board board;
	ASSERT_TRUE(board.place({0, 0}, Board::Cell::X));
	ASSERT_TRUE(board.place({1, 1}, Board::Cell::O));
	const auto state = json::array({json::array({"X", "", ""}), json::array({"", "O", ""}), json::array({"", "", ""})});

	EXPECT_EQ(json::parse(network::toMessage(network::ServerMoveAck{
	                  .success    = true,
	                  .moveNumber = 2u,
	                  .board      = board,
	                  .nextPlayer = "alice",
	                  .winner     = std::nullopt,
	                  .code       = std::nullopt,
	                  .message    = {},
	          })),
	          json({{"type", "move_ack"},
	                {"data", {{"status", "success"}, {"move_number", 2u}, {"game_state", state}, {"next_player", "alice"}, {"winner", nullptr}}}}));

	EXPECT_EQ(json::parse(network::toMessage(network::ServerMoveAck{
	                  .success    = false,
	                  .moveNumber = 2u,
	                  .board      = board,
	                  .nextPlayer = "alice",
	                  .winner     = std::nullopt,
	                  .code       = network::ErrorCode::NotYourTurn,
	                  .message    = "It is not your turn.",
	          })),
	          json({{"type", "move_ack"},
	                {"data",
	                 {{"status", "failure"},
	                  {"move_number", 2u},
	                  {"game_state", state},
	                  {"next_player", "alice"},
	                  {"winner", nullptr},
	                  {"code", "not_your_turn"},
	                  {"message", "It is not your turn."}}}}));

	EXPECT_EQ(json::parse(network::toMessage(network::ServerChatBroadcast{.username = "bob", .message = "gg"})),
	          json({{"type", "chat_broadcast"}, {"data", {{"username", "bob"}, {"message", "gg"}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerQuitAck{.message = "bob has left the game."})),
	          json({{"type", "quit_ack"}, {"data", {{"status", "success"}, {"message", "bob has left the game."}}}}));
	EXPECT_EQ(json::parse(network::toMessage(network::ServerError{.code = network::ErrorCode::InvalidGame, .message = "Game not found."})),
	          json({{"type", "error"}, {"data", {{"code", "invalid_game"}, {"message", "Game not found."}}}}));
}

TEST(GameNetMessages, ServerFromMessage) {
	const auto ack = network::fromServerMessage(
	        R"({"type":"move_ack","data":{"status":"success","move_number":3,"game_state":[["X","",""],["","O",""],["","","X"]],"next_player":"bob","winner":null}})");
	ASSERT_TRUE(ack.has_value());
	ASSERT_TRUE(std::holds_alternative<network::ServerMoveAck>(*ack));
	const auto& move = std::get<network::ServerMoveAck>(*ack);
	EXPECT_TRUE(move.success);
	EXPECT_EQ(move.moveNumber, 3u);
	EXPECT_EQ(move.board.get({0, 0}), Board::Cell::X);
	EXPECT_EQ(move.board.get({1, 1}), Board::Cell::O);
	EXPECT_EQ(move.board.get({2, 2}), Board::Cell::X);
	EXPECT_EQ(move.board.get({0, 1}), Board::Cell::Empty);
	EXPECT_EQ(move.nextPlayer, "bob");
	EXPECT_FALSE(move.winner.has_value());

	const auto draw = network::fromServerMessage(
	        R"({"type":"move_ack","data":{"status":"success","move_number":9,"game_state":[["X","O","X"],["X","O","O"],["O","X","X"]],"next_player":null,"winner":"draw"}})");
	ASSERT_TRUE(draw.has_value());
	EXPECT_EQ(std::get<network::ServerMoveAck>(*draw).winner, network::WINNER_DRAW);
	EXPECT_FALSE(std::get<network::ServerMoveAck>(*draw).nextPlayer.has_value());

	const auto join = network::fromServerMessage(R"({"type":"join_ack","data":{"status":"success","game_id":"g","player_symbol":"X","opponent":"bob"}})");
	ASSERT_TRUE(join.has_value());
	const auto& joinAck = std::get<network::ServerJoinAck>(*join);
	EXPECT_EQ(joinAck.status, network::JoinStatus::Success);
	EXPECT_EQ(joinAck.symbol, Symbol::X);
	EXPECT_EQ(joinAck.opponent, "bob");
	EXPECT_TRUE(joinAck.opponentAvatar.empty());

	const auto error = network::fromServerMessage(R"({"type":"error","data":{"code":"server_full","message":"full"}})");
	ASSERT_TRUE(error.has_value());
	EXPECT_EQ(std::get<network::ServerError>(*error).code, network::ErrorCode::ServerFull);

	EXPECT_FALSE(network::fromServerMessage(R"({"type":"move_ack","data":{"status":"success","game_state":[["Z","",""],["","",""],["","",""]]}})").has_value());
	EXPECT_FALSE(network::fromServerMessage(R"({"type":"error","data":{"code":"no_such_code"}})").has_value());
	EXPECT_FALSE(network::fromServerMessage(R"({"type":"join","data":{}})").has_value());
	EXPECT_FALSE(network::fromServerMessage("{").has_value());
}

} // namespace noughts::gtest
