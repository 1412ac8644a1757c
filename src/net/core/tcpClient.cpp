#include "network/core/tcpClient.hpp"

#include <asio.hpp>
#include <asio/connect.hpp>
#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <atomic>
#include <mutex>
#include <utility>

namespace noughts::network::core {

class TcpClient::Implementation {
public:
	Implementation();

public:
	bool connect(std::string host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const Message& message);
	Message read();

private:
	asio::io_context m_ioContext{};
	asio::ip::tcp::resolver m_resolver;
	asio::ip::tcp::socket m_socket;
	asio::streambuf m_readBuffer;

	std::mutex m_writeMutex; //!< Several threads may send.
	std::atomic<bool> m_isConnected{false};
};

TcpClient::Implementation::Implementation() : m_resolver(m_ioContext), m_socket(m_ioContext), m_readBuffer(MAX_PAYLOAD_BYTES) {
}

bool TcpClient::Implementation::connect(std::string host, std::uint16_t port) {
	if (m_isConnected) {
		return false;
	}

	// Use error_code overloads to avoid exceptions.
	asio::error_code ec;
	const auto endpoints = m_resolver.resolve(host, std::to_string(port), ec);
	if (ec) {
		return false;
	}
	asio::connect(m_socket, endpoints, ec);
	if (ec) {
		return false;
	}

	m_readBuffer.consume(m_readBuffer.size()); // Drop leftovers of an earlier connection.
	m_isConnected = true;
	return true;
}

void TcpClient::Implementation::disconnect() {
	asio::error_code ec;
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_isConnected = false;
}

bool TcpClient::Implementation::isConnected() const {
	return m_isConnected;
}

bool TcpClient::Implementation::send(const Message& message) {
	if (!m_isConnected || message.size() >= MAX_PAYLOAD_BYTES) {
		return false;
	}

	const auto framed = message + MESSAGE_DELIMITER;

	std::lock_guard<std::mutex> lock(m_writeMutex);
	asio::error_code ec;
	asio::write(m_socket, asio::buffer(framed), ec);
	if (ec) {
		m_isConnected = false;
		return false;
	}
	return true;
}

Message TcpClient::Implementation::read() {
	while (m_isConnected) {
		asio::error_code ec;
		const auto bytes = asio::read_until(m_socket, m_readBuffer, MESSAGE_DELIMITER, ec);
		if (ec) {
			m_isConnected = false;
			return {};
		}

		const auto begin = asio::buffers_begin(m_readBuffer.data());
		Message line(begin, begin + static_cast<std::ptrdiff_t>(bytes - 1));
		m_readBuffer.consume(bytes);
		if (!line.empty() && line.back() == '\r') {
			line.pop_back();
		}
		if (!line.empty()) {
			return line;
		}
	}
	return {};
}


TcpClient::TcpClient() : m_pimpl(std::make_unique<Implementation>()) {
}

TcpClient::~TcpClient() {
	disconnect();
}

bool TcpClient::connect(std::string host, std::uint16_t port) {
	return m_pimpl->connect(std::move(host), port);
}

void TcpClient::disconnect() {
	m_pimpl->disconnect();
}

bool TcpClient::isConnected() const {
	return m_pimpl->isConnected();
}

bool TcpClient::send(const Message& message) {
	return m_pimpl->send(message);
}

Message TcpClient::read() {
	return m_pimpl->read();
}

} // namespace noughts::network::core
