#include "network/client.hpp"

#include "network/core/tcpClient.hpp"

#include <atomic>
#include <thread>

namespace noughts::network {

class Client::Implementation {
public:
	Implementation() = default;

	bool registerHandler(IClientHandler* handler);

	bool connect(const std::string& host, std::uint16_t port);
	void disconnect();
	bool isConnected() const;

	bool send(const ClientEvent& event);

private:
	void startReadLoop(); //!< Starts background read thread for blocking reads.
	void stopReadLoop();
	void readLoop();

private:
	void handleNetworkEvent(const ServerJoinAck& event);
	void handleNetworkEvent(const ServerMoveAck& event);
	void handleNetworkEvent(const ServerChatBroadcast& event);
	void handleNetworkEvent(const ServerQuitAck& event);
	void handleNetworkEvent(const ServerError& event);

private:
	core::TcpClient m_client;
	std::atomic<bool> m_running{false}; //!< Read thread running.
	std::thread m_readThread;

	IClientHandler* m_handler{nullptr};
};

bool Client::Implementation::registerHandler(IClientHandler* handler) {
	if (m_handler) {
		return false;
	}
	m_handler = handler;
	return true;
}

bool Client::Implementation::connect(const std::string& host, std::uint16_t port) {
	if (m_client.isConnected()) {
		return false;
	}

	// Start the blocking read loop only after a successful connect.
	if (m_client.connect(host, port)) {
		stopReadLoop();
		startReadLoop();
		return true;
	}
	return false;
}

void Client::Implementation::disconnect() {
	m_client.disconnect();
	stopReadLoop();
}

bool Client::Implementation::isConnected() const {
	return m_client.isConnected();
}

bool Client::Implementation::send(const ClientEvent& event) {
	return m_client.send(toMessage(event));
}

void Client::Implementation::startReadLoop() {
	if (m_running.exchange(true)) {
		return;
	}
	if (m_readThread.joinable()) {
		m_readThread.join();
	}
	m_readThread = std::thread([this] { readLoop(); });
}

void Client::Implementation::stopReadLoop() {
	m_running = false;

	if (m_readThread.joinable() && m_readThread.get_id() != std::this_thread::get_id()) {
		m_readThread.join();
	} else if (m_readThread.joinable()) {
		m_readThread.detach();
	}
}

void Client::Implementation::readLoop() {
	while (m_running) {
		// TcpClient::read is blocking. Empty means the connection is gone.
		const auto message = m_client.read();
		if (message.empty()) {
			break;
		}

		const auto event = fromServerMessage(message);
		if (!event) {
			continue;
		}
		std::visit([&](const auto& e) { handleNetworkEvent(e); }, *event);
	}

	m_running = false;
	if (m_handler) {
		m_handler->onDisconnected();
	}
}

void Client::Implementation::handleNetworkEvent(const ServerJoinAck& event) {
	if (m_handler) {
		m_handler->onJoinAck(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerMoveAck& event) {
	if (m_handler) {
		m_handler->onMoveAck(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerChatBroadcast& event) {
	if (m_handler) {
		m_handler->onChat(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerQuitAck& event) {
	if (m_handler) {
		m_handler->onQuitAck(event);
	}
}

void Client::Implementation::handleNetworkEvent(const ServerError& event) {
	if (m_handler) {
		m_handler->onError(event);
	}
}


Client::Client() : m_pimpl(std::make_unique<Implementation>()) {
}

Client::~Client() {
	disconnect();
}

bool Client::registerHandler(IClientHandler* handler) {
	return m_pimpl->registerHandler(handler);
}

bool Client::connect(const std::string& host, std::uint16_t port) {
	return m_pimpl->connect(host, port);
}

void Client::disconnect() {
	m_pimpl->disconnect();
}

bool Client::isConnected() const {
	return m_pimpl->isConnected();
}

bool Client::send(const ClientEvent& event) {
	return m_pimpl->send(event);
}

} // namespace noughts::network
