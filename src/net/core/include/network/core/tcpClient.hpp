#pragma once

#include "network/core/protocol.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace noughts {
namespace network {
namespace core {

//! Minimal synchronous TCP client speaking newline delimited messages.
//! \note    This is intentionally blocking I/O to keep the client logic simple.
//!          On any network failure, send/read return false/empty and the client is considered disconnected.
//! \example Usage: connect() once, then send() from one thread and read() from another.
class TcpClient {
public:
	TcpClient();
	~TcpClient();

	TcpClient(const TcpClient&)            = delete;
	TcpClient& operator=(const TcpClient&) = delete;
	TcpClient(TcpClient&&)                 = delete;
	TcpClient& operator=(TcpClient&&)      = delete;

	//! Connect to host:port. Returns false on failure or if already connected.
	bool connect(std::string host, std::uint16_t port = DEFAULT_PORT);
	bool isConnected() const;
	void disconnect();

	bool send(const Message& message); //!< Send one message followed by the delimiter. Returns false on failure.
	Message read();                    //!< Read the next non-empty line. Returns empty string if disconnected or on error.

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl; //!< Pimpl to hide asio stuff in public interfaces.
};

} // namespace core
} // namespace network
} // namespace noughts
