#include "noughts/gameServer.hpp"

#include "app/gameHub.hpp"
#include "app/messageSink.hpp"
#include "logging.hpp"
#include "network/core/tcpServer.hpp"

#include <format>

namespace noughts::app {

class GameServer::Implementation : public IMessageSink {
public:
	explicit Implementation(const ServerConfig& config);

	bool start();
	void stop();

	std::uint16_t port() const;
	std::size_t activeSessions() const;

	// IMessageSink overrides
	bool send(ConnectionId connectionId, const Message& message) override;
	void close(ConnectionId connectionId) override;

private:
	network::core::TcpServer m_server;
	GameHub m_hub;
};

GameServer::Implementation::Implementation(const ServerConfig& config)
    : m_server({.host = config.host, .port = config.port, .workers = config.workers, .idleTimeout = config.idleTimeout}), m_hub(*this, config.maxConnections) {
	m_server.connect({
	        .onConnect    = [this](const ConnectionId& connectionId) { m_hub.onClientConnected(connectionId); },
	        .onMessage    = [this](const ConnectionId& connectionId, const Message& message) { m_hub.onClientMessage(connectionId, message); },
	        .onDisconnect = [this](const ConnectionId& connectionId) { m_hub.onClientDisconnected(connectionId); },
	});
}

bool GameServer::Implementation::start() {
	if (!m_server.start()) {
		Logger().Log(Logging::LogLevel::Error, "[GameServer] Network listener failed to start.");
		return false;
	}
	Logger().Log(Logging::LogLevel::Info, std::format("[GameServer] Accepting players on port {}.", m_server.port()));
	return true;
}

void GameServer::Implementation::stop() {
	m_server.stop();
}

std::uint16_t GameServer::Implementation::port() const {
	return m_server.port();
}

std::size_t GameServer::Implementation::activeSessions() const {
	return m_hub.activeSessions();
}

bool GameServer::Implementation::send(ConnectionId connectionId, const Message& message) {
	return m_server.send(connectionId, message);
}

void GameServer::Implementation::close(ConnectionId connectionId) {
	m_server.close(connectionId);
}


GameServer::GameServer(ServerConfig config) : m_pimpl(std::make_unique<Implementation>(config)) {
}

GameServer::~GameServer() {
	stop();
}

bool GameServer::start() {
	return m_pimpl->start();
}

void GameServer::stop() {
	m_pimpl->stop();
}

std::uint16_t GameServer::port() const {
	return m_pimpl->port();
}

std::size_t GameServer::activeSessions() const {
	return m_pimpl->activeSessions();
}

} // namespace noughts::app
