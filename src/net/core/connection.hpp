#pragma once

#include "network/core/protocol.hpp"

#include <asio.hpp>

#include <atomic>
#include <chrono>
#include <deque>
#include <functional>
#include <memory>

namespace noughts::network::core {

//! Transportation primitive. Handles newline framed read/write from a single client connection.
//! \note Internals are async and serialised on a per-connection strand, so different connections are served by the worker pool in parallel.
//!       We use shared_from_this() so any in-flight async op keeps the Connection alive.
class Connection : public std::enable_shared_from_this<Connection> {
public:
	struct Callbacks {
		std::function<void(Connection&)> onConnect;
		std::function<void(Connection&, const Message&)> onMessage;
		std::function<void(Connection&)> onDisconnect;
	};

	Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, std::chrono::seconds idleTimeout, Callbacks callbacks);
	~Connection();

	void start();                  //!< Start connection: triggers onConnect and begins the async read loop.
	void stop();                   //!< Stop connection: closes the socket and cancels IO (best-effort).
	void close();                  //!< Close once every queued message has been written.
	bool send(const Message& msg); //!< Queue message for the client. Safe to call from any thread. False if stopped or msg does not fit a frame.

	ConnectionId connectionId() const; //!< Get the identifier of this connection.

private:
	void startRead();     //!< Prime async read and dispatch complete lines.
	void startWrite();    //!< Prime async write for queued messages.
	void armIdleTimer();  //!< (Re)start the idle timeout. No-op if disabled.
	void doDisconnect();  //!< Internal cleanup. Runs on the strand.

private:
	std::atomic<bool> m_running{false};           //!< Connection accepting IO.
	asio::ip::tcp::socket m_socket;               //!< Client socket.
	asio::strand<asio::any_io_executor> m_strand; //!< Serialises handlers of this connection.
	asio::steady_timer m_idleTimer;               //!< Closes silent connections.
	std::chrono::seconds m_idleTimeout;           //!< Zero disables the idle timer.
	asio::streambuf m_readBuffer;                 //!< Bytes received but not yet dispatched.

	ConnectionId m_connectionId; //!< Unique identifier on network layer.
	Callbacks m_callbacks;       //!< Used to signal to the parent.

	std::deque<Message> m_writeQueue; //!< Framed messages waiting to be written.
	bool m_writeInProgress{false};
	bool m_closeAfterWrite{false};
};

} // namespace noughts::network::core
