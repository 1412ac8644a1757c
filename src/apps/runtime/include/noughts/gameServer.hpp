#pragma once

#include "network/core/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <memory>
#include <string>

namespace noughts::app {

struct ServerConfig {
	std::string host{network::core::DEFAULT_HOST};
	std::uint16_t port{network::core::DEFAULT_PORT}; //!< 0 picks a free port.
	std::size_t workers{network::core::DEFAULT_WORKERS};
	std::size_t maxConnections{network::core::DEFAULT_MAX_CONNECTION}; //!< 0 disables the limit.
	std::chrono::seconds idleTimeout{network::core::DEFAULT_IDLE_TIMEOUT_S};
};

//! Tic-tac-toe server. Owns the TCP listener and routes its events into the game hub.
class GameServer {
public:
	explicit GameServer(ServerConfig config = {});
	~GameServer();

	GameServer(const GameServer&)            = delete;
	GameServer& operator=(const GameServer&) = delete;

	bool start(); //!< Boot the network listener. False if the address could not be bound.
	void stop();  //!< Close all connections and join the worker threads.

	std::uint16_t port() const;         //!< Port actually listened on.
	std::size_t activeSessions() const; //!< Games currently running.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace noughts::app
