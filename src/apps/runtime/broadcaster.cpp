#include "app/broadcaster.hpp"

#include "logging.hpp"

#include <format>

namespace noughts::app {

Broadcaster::Broadcaster(IMessageSink& sink, const PlayerRegistry& registry) : m_sink(sink), m_registry(registry) {
}

bool Broadcaster::send(PlayerId playerId, const network::ServerEvent& event) {
	const auto connection = m_registry.connectionOf(playerId);
	if (!connection) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Broadcaster] Player '{}' is gone. Message dropped.", playerId));
		return false;
	}
	return sendTo(*connection, event);
}

bool Broadcaster::sendTo(ConnectionId connectionId, const network::ServerEvent& event) {
	const auto message = network::toMessage(event);
	if (!m_sink.send(connectionId, message)) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Broadcaster] Message to connection '{}' dropped. Connection gone or message too large.", connectionId));
		return false;
	}
	Logger().Log(Logging::LogLevel::Debug, std::format("[Broadcaster] -> '{}': {}", connectionId, message));
	return true;
}

void Broadcaster::broadcast(const Session& session, const network::ServerEvent& event) {
	send(session.playerX().player.id, event);
	send(session.playerO().player.id, event);
}

} // namespace noughts::app
