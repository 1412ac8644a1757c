#pragma once

#include "network/core/protocol.hpp"

#include <chrono>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <memory>
#include <string>

namespace noughts {
namespace network {
namespace core {

//! Connection manager that runs an async accept loop on a pool of IO worker threads.
//! \note    This is a thin wrapper: all heavy lifting is in Connection (async read/write).
//!          Callbacks of one connection never overlap; callbacks of different connections may run in parallel.
//! \example Usage: set callbacks via connect(), then start() once. Call stop() to shut down.
class TcpServer {
public:
	struct Callbacks {
		std::function<void(const ConnectionId&)> onConnect;
		std::function<void(const ConnectionId&, const Message&)> onMessage;
		std::function<void(const ConnectionId&)> onDisconnect;
	};

	struct Options {
		std::string host{DEFAULT_HOST};
		std::uint16_t port{DEFAULT_PORT}; //!< 0 picks a free port. See port().
		std::size_t workers{DEFAULT_WORKERS};
		std::chrono::seconds idleTimeout{DEFAULT_IDLE_TIMEOUT_S};
	};

	explicit TcpServer(Options options);
	~TcpServer();

	TcpServer(const TcpServer&)            = delete;
	TcpServer& operator=(const TcpServer&) = delete;
	TcpServer(TcpServer&&)                 = delete;
	TcpServer& operator=(TcpServer&&)      = delete;

	void connect(Callbacks callbacks); //!< Connect callback functions to get event signalling. Call before start.
	bool start();                      //!< Start accepting clients. Returns false if the listening socket could not be set up.
	void stop();                       //!< Disconnect clients and stop the server. Safe to call multiple times.

	bool send(ConnectionId connectionId, const Message& msg); //!< Send message to the client with given connectionId. Returns false if not found or not sendable.
	void close(ConnectionId connectionId);                    //!< Close the connection after its queued messages are written.

	std::uint16_t port() const;          //!< Port the server listens on. 0 if not listening.
	std::size_t connectionCount() const; //!< Number of open connections.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace noughts
