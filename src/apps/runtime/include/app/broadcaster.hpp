#pragma once

#include "app/messageSink.hpp"
#include "core/playerRegistry.hpp"
#include "core/session.hpp"
#include "network/nwEvents.hpp"

namespace noughts::app {

//! Serialises server events and hands them to the transport.
//! Delivery is best effort. A vanished recipient is logged and skipped.
class Broadcaster {
public:
	Broadcaster(IMessageSink& sink, const PlayerRegistry& registry);

	bool send(PlayerId playerId, const network::ServerEvent& event);          //!< Deliver to a registered player.
	bool sendTo(ConnectionId connectionId, const network::ServerEvent& event); //!< Deliver to a raw connection.
	void broadcast(const Session& session, const network::ServerEvent& event); //!< Deliver to both participants.

private:
	IMessageSink& m_sink;
	const PlayerRegistry& m_registry;
};

} // namespace noughts::app
