#pragma once

#include "core/SafeQueue.hpp"
#include "model/board.hpp"
#include "model/symbol.hpp"
#include "network/client.hpp"

#include <cstdint>
#include <optional>
#include <string>
#include <variant>

namespace noughts::app {

//! Interactive console front end. Network callbacks and stdin lines are funnelled through one queue
//! and handled on the thread calling run().
class TerminalClient : public network::IClientHandler {
public:
	TerminalClient(std::string username, std::string avatar);
	~TerminalClient();

	bool connect(const std::string& host, std::uint16_t port);
	int run(); //!< Join and play until quit, end of input or disconnect. Returns the process exit code.

	// IClientHandler overrides
	void onJoinAck(const network::ServerJoinAck& event) override;
	void onMoveAck(const network::ServerMoveAck& event) override;
	void onChat(const network::ServerChatBroadcast& event) override;
	void onQuitAck(const network::ServerQuitAck& event) override;
	void onError(const network::ServerError& event) override;
	void onDisconnected() override;

private:
	struct InputLine {
		std::string text;
	};
	struct InputClosed {};
	struct Disconnected {};

	using Event = std::variant<network::ServerEvent, InputLine, InputClosed, Disconnected>;

	void startInput(); //!< Read stdin on a detached thread.
	void join();

	bool handle(const network::ServerEvent& event); //!< Returns false once the client should exit.
	bool handle(const InputLine& input);
	bool handle(const InputClosed&);
	bool handle(const Disconnected&);

	void handleServerEvent(const network::ServerJoinAck& event);
	void handleServerEvent(const network::ServerMoveAck& event);
	void handleServerEvent(const network::ServerChatBroadcast& event);
	void handleServerEvent(const network::ServerQuitAck& event);
	void handleServerEvent(const network::ServerError& event);

	void printBoard() const;
	void printPrompt() const;
	bool myTurn() const;

private:
	std::string m_username;
	std::string m_avatar;

	network::Client m_network;
	SafeQueue<Event> m_events;

	// Game state. Only touched on the run() thread.
	std::optional<std::string> m_gameId;
	std::optional<Symbol> m_symbol;
	std::string m_opponent;
	Board m_board;
	unsigned m_moveNumber{0u};
	bool m_gameOver{false};
	bool m_quitting{false};       //!< Quit sent. The next quit_ack or error ends the session.
	bool m_connectionLost{false}; //!< Server went away without being asked to.
};

} // namespace noughts::app
