#include "terminalClient.hpp"

#include <format>
#include <iostream>
#include <sstream>
#include <thread>
#include <utility>

namespace noughts::app {

static constexpr char HELP[] = "Commands: 'row,col' to place a mark, 'chat <text>', 'join' after a game ended, 'quit'.";

static char cellChar(const Board::Cell cell) {
	switch (cell) {
	case Board::Cell::X:
		return 'X';
	case Board::Cell::O:
		return 'O';
	case Board::Cell::Empty:
		break;
	}
	return ' ';
}

//! Accepts "row,col" and "row col".
static std::optional<Coord> parseCoord(std::string text) {
	for (auto& c: text) {
		if (c == ',') {
			c = ' ';
		}
	}

	std::istringstream stream(text);
	Coord coord{};
	std::string rest;
	if (!(stream >> coord.row >> coord.col) || (stream >> rest)) {
		return std::nullopt;
	}
	return coord;
}

TerminalClient::TerminalClient(std::string username, std::string avatar) : m_username(std::move(username)), m_avatar(std::move(avatar)) {
	m_network.registerHandler(this);
}

TerminalClient::~TerminalClient() {
	// The read thread reports into m_events. Stop it before members go away.
	m_network.disconnect();
}

bool TerminalClient::connect(const std::string& host, std::uint16_t port) {
	return m_network.connect(host, port);
}

int TerminalClient::run() {
	join();
	startInput();

	bool running = true;
	while (running) {
		const auto event = m_events.Pop();
		running          = std::visit([&](const auto& e) { return handle(e); }, event);
	}

	m_network.disconnect();
	return m_connectionLost ? 1 : 0;
}

void TerminalClient::onJoinAck(const network::ServerJoinAck& event) {
	m_events.Push(network::ServerEvent{event});
}
void TerminalClient::onMoveAck(const network::ServerMoveAck& event) {
	m_events.Push(network::ServerEvent{event});
}
void TerminalClient::onChat(const network::ServerChatBroadcast& event) {
	m_events.Push(network::ServerEvent{event});
}
void TerminalClient::onQuitAck(const network::ServerQuitAck& event) {
	m_events.Push(network::ServerEvent{event});
}
void TerminalClient::onError(const network::ServerError& event) {
	m_events.Push(network::ServerEvent{event});
}
void TerminalClient::onDisconnected() {
	m_events.Push(Disconnected{});
}

void TerminalClient::startInput() {
	// std::getline cannot be interrupted. The thread ends with the process.
	std::thread([this] {
		std::string line;
		while (std::getline(std::cin, line)) {
			m_events.Push(InputLine{line});
		}
		m_events.Push(InputClosed{});
	}).detach();
}

void TerminalClient::join() {
	m_gameId.reset();
	m_symbol.reset();
	m_opponent.clear();
	m_board      = Board{};
	m_moveNumber = 0u;
	m_gameOver   = false;

	if (!m_network.send(network::ClientJoin{.username = m_username, .avatar = m_avatar})) {
		std::cout << "Could not send join request.\n";
	}
}

bool TerminalClient::handle(const network::ServerEvent& event) {
	std::visit([&](const auto& e) { handleServerEvent(e); }, event);
	return m_network.isConnected() || !m_quitting;
}

bool TerminalClient::handle(const InputLine& input) {
	const auto& text = input.text;
	if (text.empty()) {
		return true;
	}

	if (text == "quit" || text == "exit") {
		if (!m_gameId || m_gameOver) {
			return false;
		}
		m_quitting = true;
		return m_network.send(network::ClientQuit{.gameId = *m_gameId});
	}
	if (text == "help") {
		std::cout << HELP << "\n";
		return true;
	}
	if (text == "join") {
		if (m_gameId && !m_gameOver) {
			std::cout << "Finish or quit the current game first.\n";
			return true;
		}
		join();
		return true;
	}
	if (text.starts_with("chat ")) {
		if (!m_gameId) {
			std::cout << "No game to chat in yet.\n";
			return true;
		}
		return m_network.send(network::ClientChat{.gameId = *m_gameId, .message = text.substr(5)});
	}

	const auto coord = parseCoord(text);
	if (!coord) {
		std::cout << "Unknown command. " << HELP << "\n";
		return true;
	}
	if (!m_gameId || m_gameOver) {
		std::cout << "No game in progress.\n";
		return true;
	}
	if (!myTurn()) {
		std::cout << "Wait for your opponent.\n";
		return true;
	}
	return m_network.send(network::ClientMove{.gameId = *m_gameId, .position = *coord});
}

bool TerminalClient::handle(const InputClosed&) {
	if (m_gameId && !m_gameOver && !m_network.send(network::ClientQuit{.gameId = *m_gameId})) {
		std::cout << "Could not tell the server we left.\n";
	}
	return false;
}

bool TerminalClient::handle(const Disconnected&) {
	if (!m_quitting) {
		std::cout << "Connection to the server lost.\n";
		m_connectionLost = true;
	}
	return false;
}

void TerminalClient::handleServerEvent(const network::ServerJoinAck& event) {
	if (event.status == network::JoinStatus::Waiting) {
		std::cout << event.message << "\n";
		return;
	}

	m_gameId   = event.gameId;
	m_symbol   = event.symbol;
	m_opponent = event.opponent;
	std::cout << std::format("Game started against '{}'. You play {}.\n", m_opponent, toChar(m_symbol.value_or(Symbol::X)));
	printBoard();
	printPrompt();
}

void TerminalClient::handleServerEvent(const network::ServerMoveAck& event) {
	if (!event.success) {
		std::cout << std::format("Move rejected: {}\n", event.message);
		printPrompt();
		return;
	}

	// Broadcasts of one game can overtake each other. Keep the newest board.
	if (event.moveNumber <= m_moveNumber) {
		return;
	}
	m_moveNumber = event.moveNumber;
	m_board      = event.board;
	printBoard();

	if (event.winner) {
		m_gameOver = true;
		if (*event.winner == network::WINNER_DRAW) {
			std::cout << "The game ended in a draw.\n";
		} else {
			// The last accepted move completed the line. X moves on odd move numbers.
			const auto winner = m_moveNumber % 2u == 1u ? Symbol::X : Symbol::O;
			std::cout << (winner == m_symbol ? std::string("Congratulations, you won!\n") : std::format("{} has won the game.\n", *event.winner));
		}
		std::cout << "Type 'join' to play again or 'quit' to leave.\n";
		return;
	}
	printPrompt();
}

void TerminalClient::handleServerEvent(const network::ServerChatBroadcast& event) {
	std::cout << std::format("[{}] {}\n", event.username, event.message);
}

void TerminalClient::handleServerEvent(const network::ServerQuitAck& event) {
	std::cout << event.message << "\n";
	if (m_quitting) {
		m_network.disconnect();
		return;
	}

	m_gameOver = true;
	std::cout << "Type 'join' to play again or 'quit' to leave.\n";
}

void TerminalClient::handleServerEvent(const network::ServerError& event) {
	std::cout << std::format("Server error ({}): {}\n", network::toString(event.code), event.message);
	if (m_quitting) {
		m_network.disconnect();
	}
}

void TerminalClient::printBoard() const {
	for (int row = 0; row != static_cast<int>(Board::SIZE); ++row) {
		if (row != 0) {
			std::cout << "---+---+---\n";
		}
		std::cout << std::format(" {} | {} | {} \n", cellChar(m_board.get({row, 0})), cellChar(m_board.get({row, 1})), cellChar(m_board.get({row, 2})));
	}
}

void TerminalClient::printPrompt() const {
	if (m_gameOver) {
		return;
	}
	std::cout << (myTurn() ? "Your move (row,col): " : std::format("Waiting for '{}'...\n", m_opponent)) << std::flush;
}

bool TerminalClient::myTurn() const {
	if (!m_symbol || m_gameOver) {
		return false;
	}
	const auto toMove = m_moveNumber % 2u == 0u ? Symbol::X : Symbol::O;
	return toMove == *m_symbol;
}

} // namespace noughts::app
