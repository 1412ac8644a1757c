#pragma once

#include "network/nwEvents.hpp"

#include <cstdint>
#include <memory>
#include <string>

namespace noughts::network {

//! Callback interface invoked on the client's read thread.
class IClientHandler {
public:
	virtual ~IClientHandler() = default;

	virtual void onJoinAck(const ServerJoinAck& event)    = 0;
	virtual void onMoveAck(const ServerMoveAck& event)    = 0;
	virtual void onChat(const ServerChatBroadcast& event) = 0;
	virtual void onQuitAck(const ServerQuitAck& event)    = 0;
	virtual void onError(const ServerError& event)        = 0;
	virtual void onDisconnected()                         = 0;
};

//! Game protocol client. Sends typed requests and dispatches typed server messages to the registered handler.
class Client {
public:
	Client();
	~Client();

	Client(const Client&)            = delete;
	Client& operator=(const Client&) = delete;

	//! Only one handler can be registered. Returns false if one is set already.
	bool registerHandler(IClientHandler* handler);

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const ClientEvent& event);

private:
	class Implementation;
	std::unique_ptr<Implementation> m_pimpl;
};

} // namespace noughts::network
