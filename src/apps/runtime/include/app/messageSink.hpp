#pragma once

#include "network/core/protocol.hpp"

namespace noughts::app {

using network::core::ConnectionId;
using network::core::Message;

//! Outbound side of the transport as seen by the request dispatcher.
class IMessageSink {
public:
	virtual ~IMessageSink() = default;

	virtual bool send(ConnectionId connectionId, const Message& message) = 0; //!< Queue message. False if the connection is gone or the message does not fit a frame.
	virtual void close(ConnectionId connectionId)                        = 0; //!< Close after queued messages are written.
};

} // namespace noughts::app
