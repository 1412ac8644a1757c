#include "network/core/tcpServer.hpp"

#include "connection.hpp"
#include "logging.hpp"

#include <asio.hpp>
#include <asio/ip/tcp.hpp>

#include <algorithm>
#include <atomic>
#include <format>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>
#include <unordered_map>
#include <utility>
#include <vector>

namespace noughts::network::core {

class TcpServer::Implementation {
public:
	explicit Implementation(Options options);

	bool start();
	void connect(Callbacks callbacks);
	void stop();

	bool send(ConnectionId connectionId, const Message& msg);
	void close(ConnectionId connectionId);

	std::uint16_t port() const;
	std::size_t connectionCount() const;

private:
	bool openAcceptor();                                                            //!< Open, bind and listen. Stays in error_code land.
	void doAccept();                                                                //!< Start async accept loop.
	bool createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId); //!< Create and add new connection to map. Requires m_connectionsMutex.

private:
	Options m_options;

	asio::io_context m_ioContext{};
	asio::ip::tcp::acceptor m_acceptor;
	std::optional<asio::executor_work_guard<asio::io_context::executor_type>> m_workGuard;

	std::vector<std::thread> m_workers; //!< Threads running the IO context.
	std::atomic<bool> m_running{false}; //!< TCP Server running.

	Callbacks m_callbacks; //!< Callback functions to signal events.

	ConnectionId m_nextConnectionId{1u};                                         //!< Guarded by m_connectionsMutex.
	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> m_connections; //!< Active connections.
	mutable std::mutex m_connectionsMutex;                                       //!< Handle concurrency.
};


TcpServer::Implementation::Implementation(Options options) : m_options(std::move(options)), m_acceptor(m_ioContext) {
}

bool TcpServer::Implementation::openAcceptor() {
	asio::error_code ec;
	const auto address = asio::ip::make_address(m_options.host, ec);
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Invalid host '{}': {}.", m_options.host, ec.message()));
		return false;
	}

	const asio::ip::tcp::endpoint endpoint(address, m_options.port);
	m_acceptor.open(endpoint.protocol(), ec);
	if (!ec) {
		m_acceptor.set_option(asio::ip::tcp::acceptor::reuse_address(true), ec);
	}
	if (!ec) {
		m_acceptor.bind(endpoint, ec);
	}
	if (!ec) {
		m_acceptor.listen(asio::socket_base::max_listen_connections, ec);
	}
	if (ec) {
		Logger().Log(Logging::LogLevel::Error, std::format("[TcpServer] Could not listen on {}:{}: {}.", m_options.host, m_options.port, ec.message()));
		m_acceptor.close(ec);
		return false;
	}
	return true;
}

bool TcpServer::Implementation::start() {
	if (m_running.exchange(true)) {
		return true;
	}
	if (!openAcceptor()) {
		m_running = false;
		return false;
	}

	m_ioContext.restart();
	m_workGuard.emplace(asio::make_work_guard(m_ioContext));
	doAccept();

	const auto workers = std::max<std::size_t>(1u, m_options.workers);
	for (std::size_t i = 0; i != workers; ++i) {
		m_workers.emplace_back([this]() { m_ioContext.run(); });
	}

	Logger().Log(Logging::LogLevel::Info, std::format("[TcpServer] Listening on {}:{} with {} workers.", m_options.host, port(), workers));
	return true;
}

void TcpServer::Implementation::connect(Callbacks callbacks) {
	m_callbacks = std::move(callbacks);
}

void TcpServer::Implementation::stop() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_acceptor.cancel(ec);
	m_acceptor.close(ec);

	std::unordered_map<ConnectionId, std::shared_ptr<Connection>> connections;
	{
		std::lock_guard<std::mutex> lock(m_connectionsMutex);
		connections.swap(m_connections);
	}
	for (auto& [id, conn]: connections) {
		conn->stop();
	}

	// Without the guard the workers return once the closing handlers have drained.
	if (m_workGuard) {
		m_workGuard->reset();
		m_workGuard.reset();
	}
	for (auto& worker: m_workers) {
		if (worker.joinable()) {
			worker.join();
		}
	}
	m_workers.clear();

	Logger().Log(Logging::LogLevel::Info, "[TcpServer] Stopped.");
}

bool TcpServer::Implementation::send(ConnectionId connectionId, const Message& msg) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it == m_connections.end()) {
		return false;
	}
	return it->second->send(msg);
}

void TcpServer::Implementation::close(ConnectionId connectionId) {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);

	const auto it = m_connections.find(connectionId);
	if (it != m_connections.end()) {
		it->second->close();
	}
}

std::uint16_t TcpServer::Implementation::port() const {
	asio::error_code ec;
	const auto endpoint = m_acceptor.local_endpoint(ec);
	return ec ? 0u : endpoint.port();
}

std::size_t TcpServer::Implementation::connectionCount() const {
	std::lock_guard<std::mutex> lock(m_connectionsMutex);
	return m_connections.size();
}

void TcpServer::Implementation::doAccept() {
	m_acceptor.async_accept([this](asio::error_code ec, asio::ip::tcp::socket socket) {
		if (!m_running) {
			return;
		}
		if (!ec) {
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			const auto connectionId = m_nextConnectionId++;
			if (createConnection(std::move(socket), connectionId)) {
				m_connections.at(connectionId)->start();
			}
		} else {
			Logger().Log(Logging::LogLevel::Warning, std::format("[TcpServer] Accept failed: {}.", ec.message()));
		}

		if (m_running) {
			doAccept();
		}
	});
}

bool TcpServer::Implementation::createConnection(asio::ip::tcp::socket socket, ConnectionId connectionId) {
	if (m_connections.contains(connectionId)) {
		return false;
	}

	Connection::Callbacks callbacks;
	callbacks.onConnect = [this](Connection& connection) {
		if (m_callbacks.onConnect) {
			m_callbacks.onConnect(connection.connectionId());
		}
	};
	callbacks.onMessage = [this](Connection& connection, const Message& message) {
		if (m_callbacks.onMessage) {
			m_callbacks.onMessage(connection.connectionId(), message);
		}
	};
	callbacks.onDisconnect = [this](Connection& connection) {
		const auto index = connection.connectionId();
		{
			std::lock_guard<std::mutex> lock(m_connectionsMutex);
			m_connections.erase(index);
		}
		if (m_callbacks.onDisconnect) {
			m_callbacks.onDisconnect(index);
		}
	};

	auto connection           = std::make_shared<Connection>(std::move(socket), connectionId, m_options.idleTimeout, std::move(callbacks));
	const auto [it, inserted] = m_connections.try_emplace(connectionId, std::move(connection));
	return inserted;
}


TcpServer::TcpServer(Options options) : m_pimpl(std::make_unique<Implementation>(std::move(options))) {
}

TcpServer::~TcpServer() {
	stop();
}

bool TcpServer::start() {
	return m_pimpl->start();
}

void TcpServer::connect(Callbacks callbacks) {
	m_pimpl->connect(std::move(callbacks));
}

void TcpServer::stop() {
	m_pimpl->stop();
}

bool TcpServer::send(ConnectionId connectionId, const Message& msg) {
	return m_pimpl->send(connectionId, msg);
}

void TcpServer::close(ConnectionId connectionId) {
	m_pimpl->close(connectionId);
}

std::uint16_t TcpServer::port() const {
	return m_pimpl->port();
}

std::size_t TcpServer::connectionCount() const {
	return m_pimpl->connectionCount();
}

} // namespace noughts::network::core
