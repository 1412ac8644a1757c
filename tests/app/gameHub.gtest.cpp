#include "app/gameHub.hpp"
#include "app/messageSink.hpp"
#include "network/core/protocol.hpp"

#include <gtest/gtest.h>

#include <nlohmann/json.hpp>

#include <algorithm>
#include <mutex>
#include <set>
#include <string>
#include <thread>
#include <utility>
#include <vector>

namespace noughts::gtest {

using nlohmann::json;

//! Records outbound traffic instead of writing to sockets.
class RecordingSink final : public app::IMessageSink {
public:
	bool send(app::ConnectionId connectionId, const app::Message& message) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		if (m_closed.contains(connectionId)) {
			return false;
		}
		if (message.size() >= network::core::MAX_PAYLOAD_BYTES) {
			++m_oversized;
			return false;
		}
		m_sent.emplace_back(connectionId, json::parse(message));
		return true;
	}

	void close(app::ConnectionId connectionId) override {
		std::lock_guard<std::mutex> lock(m_mutex);
		m_closed.insert(connectionId);
	}

	//! Messages sent to a connection since the last call, oldest first.
	std::vector<json> take(app::ConnectionId connectionId) {
		std::lock_guard<std::mutex> lock(m_mutex);

		std::vector<json> taken;
		std::vector<std::pair<app::ConnectionId, json>> rest;
		for (auto& [id, message]: m_sent) {
			if (id == connectionId) {
				taken.push_back(std::move(message));
			} else {
				rest.emplace_back(id, std::move(message));
			}
		}
		m_sent.swap(rest);
		return taken;
	}

	bool isClosed(app::ConnectionId connectionId) const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_closed.contains(connectionId);
	}

	//! Messages refused because they do not fit a frame.
	std::size_t oversized() const {
		std::lock_guard<std::mutex> lock(m_mutex);
		return m_oversized;
	}

private:
	mutable std::mutex m_mutex;
	std::size_t m_oversized{0u};
	std::vector<std::pair<app::ConnectionId, json>> m_sent;
	std::set<app::ConnectionId> m_closed;
};

static std::string joinRequest(const std::string& name) {
	return json({{"type", "join"}, {"data", {{"username", name}}}}).dump();
}
static std::string moveRequest(const std::string& gameId, int row, int col) {
	return json({{"type", "move"}, {"data", {{"game_id", gameId}, {"position", json::array({row, col})}}}}).dump();
}
static std::string chatRequest(const std::string& gameId, const std::string& text) {
	return json({{"type", "chat"}, {"data", {{"game_id", gameId}, {"message", text}}}}).dump();
}
static std::string quitRequest(const std::string& gameId) {
	return json({{"type", "quit"}, {"data", {{"game_id", gameId}}}}).dump();
}

//! Number of "opponent has left" notices among messages.
static std::size_t leaveNotices(const std::vector<json>& messages) {
	return static_cast<std::size_t>(std::count_if(messages.begin(), messages.end(), [](const json& message) {
		return message["type"] == "quit_ack" && message["data"]["message"] != "You left the game.";
	}));
}

class GameHubTest : public ::testing::Test {
protected:
	static constexpr app::ConnectionId ALICE = 1u;
	static constexpr app::ConnectionId BOB   = 2u;
	static constexpr app::ConnectionId CAROL = 3u;

	//! Only message sent to a connection. Fails the test if there is not exactly one.
	json single(app::ConnectionId connectionId) {
		const auto messages = sink.take(connectionId);
		EXPECT_EQ(messages.size(), 1u) << "connection " << connectionId;
		return messages.empty() ? json{} : messages.front();
	}

	//! Connect alice and bob and pair them. Returns the game id.
	std::string startGame() {
		hub.onClientConnected(ALICE);
		hub.onClientConnected(BOB);
		hub.onClientMessage(ALICE, joinRequest("alice"));
		hub.onClientMessage(BOB, joinRequest("bob"));

		const auto aliceMessages = sink.take(ALICE);
		EXPECT_EQ(aliceMessages.size(), 2u);
		sink.take(BOB);
		return aliceMessages.empty() ? std::string{} : aliceMessages.back()["data"]["game_id"].get<std::string>();
	}

	void play(const std::string& gameId, const std::vector<std::pair<int, int>>& moves) {
		for (std::size_t i = 0; i != moves.size(); ++i) {
			hub.onClientMessage(i % 2 == 0 ? ALICE : BOB, moveRequest(gameId, moves[i].first, moves[i].second));
		}
	}

	RecordingSink sink;
	app::GameHub hub{sink, 0u};
};

TEST_F(GameHubTest, FirstJoinWaits) {
	hub.onClientConnected(ALICE);
	hub.onClientMessage(ALICE, joinRequest("alice"));

	EXPECT_EQ(single(ALICE), json({{"type", "join_ack"}, {"data", {{"status", "waiting"}, {"message", "Waiting for an opponent..."}}}}));
	EXPECT_TRUE(hub.hasWaitingPlayer());
	EXPECT_EQ(hub.activeSessions(), 0u);
}

TEST_F(GameHubTest, SecondJoinStartsGame) {
	hub.onClientConnected(ALICE);
	hub.onClientConnected(BOB);
	hub.onClientMessage(ALICE, joinRequest("alice"));
	hub.onClientMessage(BOB, json({{"type", "join"}, {"data", {{"username", "bob"}, {"avatar", "cat"}}}}).dump());

	const auto aliceMessages = sink.take(ALICE);
	ASSERT_EQ(aliceMessages.size(), 2u);
	EXPECT_EQ(aliceMessages[0]["data"]["status"], "waiting");

	const auto& aliceAck = aliceMessages[1];
	const auto bobAck    = single(BOB);
	EXPECT_EQ(aliceAck["type"], "join_ack");
	EXPECT_EQ(aliceAck["data"]["status"], "success");
	EXPECT_EQ(aliceAck["data"]["player_symbol"], "X");
	EXPECT_EQ(aliceAck["data"]["opponent"], "bob");
	EXPECT_EQ(aliceAck["data"]["opponent_avatar"], "cat");

	EXPECT_EQ(bobAck["data"]["status"], "success");
	EXPECT_EQ(bobAck["data"]["player_symbol"], "O");
	EXPECT_EQ(bobAck["data"]["opponent"], "alice");
	EXPECT_FALSE(bobAck["data"].contains("opponent_avatar"));

	EXPECT_EQ(aliceAck["data"]["game_id"], bobAck["data"]["game_id"]);
	EXPECT_FALSE(hub.hasWaitingPlayer());
	EXPECT_EQ(hub.activeSessions(), 1u);
}

TEST_F(GameHubTest, MovesAreBroadcast) {
	const auto gameId = startGame();

	hub.onClientMessage(ALICE, moveRequest(gameId, 0, 0));
	const auto aliceUpdate = single(ALICE);
	const auto bobUpdate   = single(BOB);
	EXPECT_EQ(aliceUpdate, bobUpdate);
	EXPECT_EQ(aliceUpdate["type"], "move_ack");
	EXPECT_EQ(aliceUpdate["data"]["status"], "success");
	EXPECT_EQ(aliceUpdate["data"]["game_state"][0][0], "X");
	EXPECT_EQ(aliceUpdate["data"]["next_player"], "bob");
	EXPECT_TRUE(aliceUpdate["data"]["winner"].is_null());
	EXPECT_EQ(aliceUpdate["data"]["move_number"], 1u);

	// Occupied cell. Only the requester hears about it.
	hub.onClientMessage(BOB, moveRequest(gameId, 0, 0));
	const auto rejected = single(BOB);
	EXPECT_EQ(rejected["data"]["status"], "failure");
	EXPECT_EQ(rejected["data"]["code"], "invalid_move");
	EXPECT_EQ(rejected["data"]["game_state"][0][0], "X");
	EXPECT_TRUE(sink.take(ALICE).empty());

	hub.onClientMessage(BOB, moveRequest(gameId, 1, 1));
	const auto accepted = single(ALICE);
	EXPECT_EQ(accepted, single(BOB));
	EXPECT_EQ(accepted["data"]["status"], "success");
	EXPECT_EQ(accepted["data"]["game_state"][1][1], "O");
	EXPECT_EQ(accepted["data"]["next_player"], "alice");
}

TEST_F(GameHubTest, RuleViolations) {
	const auto gameId = startGame();

	hub.onClientMessage(BOB, moveRequest(gameId, 0, 0));
	const auto notYourTurn = single(BOB);
	EXPECT_EQ(notYourTurn["type"], "move_ack");
	EXPECT_EQ(notYourTurn["data"]["status"], "failure");
	EXPECT_EQ(notYourTurn["data"]["code"], "not_your_turn");
	EXPECT_EQ(notYourTurn["data"]["next_player"], "alice");

	hub.onClientMessage(ALICE, moveRequest(gameId, 3, 0));
	const auto outside = single(ALICE);
	EXPECT_EQ(outside["data"]["status"], "failure");
	EXPECT_EQ(outside["data"]["code"], "invalid_move");

	EXPECT_TRUE(sink.take(BOB).empty());
}

TEST_F(GameHubTest, WinEndsGame) {
	const auto gameId = startGame();

	play(gameId, {{0, 0}, {1, 0}, {0, 1}, {1, 1}});
	sink.take(ALICE);
	sink.take(BOB);

	hub.onClientMessage(ALICE, moveRequest(gameId, 0, 2));
	const auto last = single(BOB);
	EXPECT_EQ(last, single(ALICE));
	EXPECT_EQ(last["data"]["winner"], "alice");
	EXPECT_TRUE(last["data"]["next_player"].is_null());
	EXPECT_EQ(hub.activeSessions(), 0u);

	// The game is gone.
	hub.onClientMessage(BOB, moveRequest(gameId, 2, 2));
	const auto error = single(BOB);
	EXPECT_EQ(error["type"], "error");
	EXPECT_EQ(error["data"]["code"], "invalid_game");
}

TEST_F(GameHubTest, FullBoardIsDraw) {
	const auto gameId = startGame();

	// X O X
	// X O O
	// O X X
	play(gameId, {{0, 0}, {0, 1}, {0, 2}, {1, 1}, {1, 0}, {1, 2}, {2, 1}, {2, 0}, {2, 2}});

	const auto aliceMessages = sink.take(ALICE);
	ASSERT_EQ(aliceMessages.size(), 9u);
	EXPECT_EQ(aliceMessages.back()["data"]["winner"], "draw");
	EXPECT_EQ(aliceMessages.back()["data"]["move_number"], 9u);
	for (std::size_t i = 0; i + 1 != aliceMessages.size(); ++i) {
		EXPECT_TRUE(aliceMessages[i]["data"]["winner"].is_null());
	}
	EXPECT_EQ(hub.activeSessions(), 0u);
}

TEST_F(GameHubTest, ChatReachesBoth) {
	const auto gameId = startGame();

	hub.onClientMessage(BOB, chatRequest(gameId, "good luck"));
	const auto expected = json({{"type", "chat_broadcast"}, {"data", {{"username", "bob"}, {"message", "good luck"}}}});
	EXPECT_EQ(single(ALICE), expected);
	EXPECT_EQ(single(BOB), expected);
}

TEST_F(GameHubTest, QuitNotifiesBoth) {
	const auto gameId = startGame();

	hub.onClientMessage(ALICE, quitRequest(gameId));
	EXPECT_EQ(single(ALICE), json({{"type", "quit_ack"}, {"data", {{"status", "success"}, {"message", "You left the game."}}}}));
	EXPECT_EQ(single(BOB), json({{"type", "quit_ack"}, {"data", {{"status", "success"}, {"message", "alice has left the game."}}}}));
	EXPECT_EQ(hub.activeSessions(), 0u);

	// Leaving connection does not trigger a second notice.
	hub.onClientDisconnected(ALICE);
	EXPECT_TRUE(sink.take(BOB).empty());
}

TEST_F(GameHubTest, DisconnectAbandonsOnce) {
	const auto gameId = startGame();
	hub.onClientMessage(ALICE, moveRequest(gameId, 0, 0));
	sink.take(ALICE);
	sink.take(BOB);

	hub.onClientDisconnected(ALICE);
	EXPECT_EQ(single(BOB), json({{"type", "quit_ack"}, {"data", {{"status", "success"}, {"message", "alice has left the game."}}}}));
	EXPECT_EQ(hub.activeSessions(), 0u);

	hub.onClientDisconnected(BOB);
	EXPECT_TRUE(sink.take(BOB).empty());
	EXPECT_TRUE(sink.take(ALICE).empty());
}

TEST_F(GameHubTest, ConcurrentDisconnects) {
	for (int round = 0; round != 50; ++round) {
		RecordingSink raceSink;
		app::GameHub raceHub(raceSink, 0u);
		raceHub.onClientConnected(ALICE);
		raceHub.onClientConnected(BOB);
		raceHub.onClientMessage(ALICE, joinRequest("alice"));
		raceHub.onClientMessage(BOB, joinRequest("bob"));
		raceSink.take(ALICE);
		raceSink.take(BOB);

		std::thread first([&] { raceHub.onClientDisconnected(ALICE); });
		std::thread second([&] { raceHub.onClientDisconnected(BOB); });
		first.join();
		second.join();

		// At most one side is still registered when the other leaves. Never two notices.
		EXPECT_LE(raceSink.take(ALICE).size() + raceSink.take(BOB).size(), 1u);
		EXPECT_EQ(raceHub.activeSessions(), 0u);
		EXPECT_FALSE(raceHub.hasWaitingPlayer());
	}
}

TEST_F(GameHubTest, JoinRacesWaitingPlayerDisconnect) {
	for (int round = 0; round != 100; ++round) {
		RecordingSink raceSink;
		app::GameHub raceHub(raceSink, 0u);
		raceHub.onClientConnected(ALICE);
		raceHub.onClientConnected(BOB);
		raceHub.onClientMessage(ALICE, joinRequest("alice"));
		raceSink.take(ALICE);

		std::thread joiner([&] { raceHub.onClientMessage(BOB, joinRequest("bob")); });
		std::thread leaver([&] { raceHub.onClientDisconnected(ALICE); });
		joiner.join();
		leaver.join();

		const auto bobMessages = raceSink.take(BOB);
		ASSERT_FALSE(bobMessages.empty());
		EXPECT_EQ(bobMessages.front()["type"], "join_ack");
		EXPECT_EQ(raceHub.activeSessions(), 0u);

		if (bobMessages.front()["data"]["status"] == "waiting") {
			// Alice left first. Bob took the empty slot.
			EXPECT_EQ(bobMessages.size(), 1u);
			EXPECT_TRUE(raceHub.hasWaitingPlayer());
		} else {
			// Paired first. The start of the game precedes the single abandonment notice.
			ASSERT_EQ(bobMessages.size(), 2u);
			EXPECT_EQ(bobMessages[0]["data"]["status"], "success");
			EXPECT_EQ(bobMessages[1], json({{"type", "quit_ack"}, {"data", {{"status", "success"}, {"message", "alice has left the game."}}}}));
			EXPECT_FALSE(raceHub.hasWaitingPlayer());
		}
	}
}

TEST_F(GameHubTest, QuitRacesOpponentDisconnect) {
	for (int round = 0; round != 100; ++round) {
		RecordingSink raceSink;
		app::GameHub raceHub(raceSink, 0u);
		raceHub.onClientConnected(ALICE);
		raceHub.onClientConnected(BOB);
		raceHub.onClientMessage(ALICE, joinRequest("alice"));
		raceHub.onClientMessage(BOB, joinRequest("bob"));
		const auto gameId = raceSink.take(ALICE).back()["data"]["game_id"].get<std::string>();
		raceSink.take(BOB);

		std::thread quitter([&] { raceHub.onClientMessage(ALICE, quitRequest(gameId)); });
		std::thread leaver([&] { raceHub.onClientDisconnected(BOB); });
		quitter.join();
		leaver.join();

		const auto aliceMessages = raceSink.take(ALICE);
		const auto bobMessages   = raceSink.take(BOB);
		EXPECT_GE(aliceMessages.size(), 1u);
		EXPECT_LE(aliceMessages.size(), 2u);
		EXPECT_LE(leaveNotices(aliceMessages) + leaveNotices(bobMessages), 1u);
		EXPECT_EQ(raceHub.activeSessions(), 0u);
		EXPECT_FALSE(raceHub.hasWaitingPlayer());

		// Nothing is left bound to alice. She can queue again.
		raceHub.onClientMessage(ALICE, joinRequest("alice"));
		const auto rejoin = raceSink.take(ALICE);
		ASSERT_EQ(rejoin.size(), 1u);
		EXPECT_EQ(rejoin.front()["data"]["status"], "waiting");
	}
}

TEST_F(GameHubTest, OverlongTextIsRejected) {
	using network::core::MAX_CHAT_BYTES;
	using network::core::MAX_USERNAME_BYTES;

	hub.onClientConnected(ALICE);
	hub.onClientMessage(ALICE, joinRequest(std::string(MAX_USERNAME_BYTES + 1u, 'a')));
	EXPECT_EQ(single(ALICE)["data"]["code"], "missing_data");
	EXPECT_FALSE(hub.hasWaitingPlayer());

	// Longest accepted name and chat still produce deliverable replies.
	const std::string aliceName(MAX_USERNAME_BYTES, '\x01');
	const std::string bobName(MAX_USERNAME_BYTES, '\x02');
	hub.onClientConnected(BOB);
	hub.onClientMessage(ALICE, joinRequest(aliceName));
	hub.onClientMessage(BOB, joinRequest(bobName));
	const auto aliceMessages = sink.take(ALICE);
	ASSERT_EQ(aliceMessages.size(), 2u);
	EXPECT_EQ(aliceMessages[1]["data"]["opponent"], bobName);
	const auto gameId = aliceMessages[1]["data"]["game_id"].get<std::string>();
	EXPECT_EQ(single(BOB)["data"]["opponent"], aliceName);

	hub.onClientMessage(ALICE, moveRequest(gameId, 0, 0));
	EXPECT_EQ(single(ALICE)["data"]["next_player"], bobName);
	EXPECT_EQ(single(BOB)["data"]["next_player"], bobName);

	const std::string text(MAX_CHAT_BYTES, '\x03');
	hub.onClientMessage(BOB, chatRequest(gameId, text));
	EXPECT_EQ(single(ALICE)["data"]["message"], text);
	EXPECT_EQ(single(BOB)["data"]["message"], text);

	hub.onClientMessage(BOB, chatRequest(gameId, text + "!"));
	EXPECT_EQ(single(BOB)["data"]["code"], "missing_data");
	EXPECT_TRUE(sink.take(ALICE).empty());

	hub.onClientDisconnected(BOB);
	EXPECT_EQ(single(ALICE)["type"], "quit_ack");
	EXPECT_EQ(sink.oversized(), 0u);
}

TEST_F(GameHubTest, WaitingPlayerDisconnects) {
	hub.onClientConnected(ALICE);
	hub.onClientMessage(ALICE, joinRequest("alice"));
	hub.onClientDisconnected(ALICE);
	EXPECT_FALSE(hub.hasWaitingPlayer());

	// Bob waits instead of pairing with a ghost.
	hub.onClientConnected(BOB);
	hub.onClientMessage(BOB, joinRequest("bob"));
	EXPECT_EQ(single(BOB)["data"]["status"], "waiting");
	EXPECT_EQ(hub.activeSessions(), 0u);
}

TEST_F(GameHubTest, ThirdJoinWaits) {
	const auto gameId = startGame();

	hub.onClientConnected(CAROL);
	hub.onClientMessage(CAROL, joinRequest("carol"));
	EXPECT_EQ(single(CAROL)["data"]["status"], "waiting");
	EXPECT_TRUE(hub.hasWaitingPlayer());
	EXPECT_EQ(hub.activeSessions(), 1u);

	// Running game is untouched.
	hub.onClientMessage(ALICE, moveRequest(gameId, 2, 2));
	EXPECT_EQ(single(BOB)["data"]["status"], "success");
	EXPECT_EQ(single(ALICE)["data"]["status"], "success");

	// Carol cannot interfere with it.
	hub.onClientMessage(CAROL, moveRequest(gameId, 0, 0));
	EXPECT_EQ(single(CAROL)["data"]["code"], "not_in_game");
}

TEST_F(GameHubTest, AlreadyJoined) {
	hub.onClientConnected(ALICE);
	hub.onClientMessage(ALICE, joinRequest("alice"));
	sink.take(ALICE);

	hub.onClientMessage(ALICE, joinRequest("alice"));
	EXPECT_EQ(single(ALICE)["data"]["code"], "already_joined");

	hub.onClientConnected(BOB);
	hub.onClientMessage(BOB, joinRequest("bob"));
	sink.take(ALICE);
	sink.take(BOB);

	hub.onClientMessage(BOB, joinRequest("bob"));
	EXPECT_EQ(single(BOB)["data"]["code"], "already_joined");
	EXPECT_EQ(hub.activeSessions(), 1u);
	EXPECT_FALSE(hub.hasWaitingPlayer());
}

TEST_F(GameHubTest, RejoinAfterGameEnded) {
	const auto gameId = startGame();
	play(gameId, {{0, 0}, {1, 0}, {0, 1}, {1, 1}, {0, 2}});
	sink.take(ALICE);
	sink.take(BOB);

	hub.onClientMessage(BOB, joinRequest("bob"));
	EXPECT_EQ(single(BOB)["data"]["status"], "waiting");

	hub.onClientMessage(ALICE, joinRequest("alice"));
	const auto aliceAck = single(ALICE);
	EXPECT_EQ(aliceAck["data"]["status"], "success");
	EXPECT_EQ(aliceAck["data"]["player_symbol"], "O");
	EXPECT_NE(aliceAck["data"]["game_id"], gameId);
	EXPECT_EQ(single(BOB)["data"]["player_symbol"], "X");
}

TEST_F(GameHubTest, ProtocolErrors) {
	hub.onClientConnected(ALICE);

	hub.onClientMessage(ALICE, "{not json");
	EXPECT_EQ(single(ALICE)["data"]["code"], "invalid_json");

	hub.onClientMessage(ALICE, R"({"type":"dance","data":{}})");
	EXPECT_EQ(single(ALICE)["data"]["code"], "unknown_type");

	hub.onClientMessage(ALICE, R"({"type":"move","data":{"game_id":"g"}})");
	EXPECT_EQ(single(ALICE)["data"]["code"], "missing_data");

	// Not joined yet.
	hub.onClientMessage(ALICE, moveRequest("g", 0, 0));
	EXPECT_EQ(single(ALICE)["data"]["code"], "not_in_game");

	// Connection stays usable.
	hub.onClientMessage(ALICE, joinRequest("alice"));
	EXPECT_EQ(single(ALICE)["data"]["status"], "waiting");

	hub.onClientMessage(ALICE, chatRequest("unknown-game", "hello?"));
	EXPECT_EQ(single(ALICE)["data"]["code"], "invalid_game");
	EXPECT_FALSE(sink.isClosed(ALICE));
}

TEST_F(GameHubTest, GeneratedName) {
	hub.onClientConnected(ALICE);
	hub.onClientConnected(BOB);
	hub.onClientMessage(ALICE, R"({"type":"join","data":{}})");
	hub.onClientMessage(BOB, joinRequest("bob"));

	const auto bobAck = single(BOB);
	const auto name   = bobAck["data"]["opponent"].get<std::string>();
	EXPECT_EQ(name.rfind("Player_", 0), 0u) << name;
}

TEST(GameHubLimits, ConnectionLimit) {
	RecordingSink sink;
	app::GameHub hub(sink, 2u);

	hub.onClientConnected(1u);
	hub.onClientConnected(2u);
	hub.onClientConnected(3u);

	const auto refused = sink.take(3u);
	ASSERT_EQ(refused.size(), 1u);
	EXPECT_EQ(refused.front()["data"]["code"], "server_full");
	EXPECT_TRUE(sink.isClosed(3u));
	EXPECT_FALSE(sink.isClosed(1u));

	// Refused connections are not served.
	hub.onClientMessage(3u, joinRequest("late"));
	EXPECT_FALSE(hub.hasWaitingPlayer());

	// A free slot is reusable.
	hub.onClientDisconnected(3u);
	hub.onClientDisconnected(2u);
	hub.onClientConnected(4u);
	EXPECT_TRUE(sink.take(4u).empty());
	EXPECT_FALSE(sink.isClosed(4u));
}

} // namespace noughts::gtest
