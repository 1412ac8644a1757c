#include "connection.hpp"

#include "logging.hpp"

#include <asio/read_until.hpp>
#include <asio/write.hpp>

#include <format>
#include <string>
#include <utility>

namespace noughts::network::core {

Connection::Connection(asio::ip::tcp::socket socket, ConnectionId connectionId, std::chrono::seconds idleTimeout, Callbacks callbacks)
    : m_socket(std::move(socket)), m_strand(asio::make_strand(m_socket.get_executor())), m_idleTimer(m_strand), m_idleTimeout(idleTimeout),
      m_readBuffer(MAX_PAYLOAD_BYTES), m_connectionId(connectionId), m_callbacks(std::move(callbacks)) {
}

Connection::~Connection() {
	asio::error_code ec;
	m_socket.close(ec);
}

void Connection::start() {
	if (m_running.exchange(true)) {
		return;
	}

	// Callbacks must never run inside the caller's locks. Hop onto the strand first.
	asio::post(m_strand, [self = shared_from_this()] {
		if (self->m_callbacks.onConnect) {
			self->m_callbacks.onConnect(*self);
		}
		self->startRead();
	});
}

void Connection::stop() {
	asio::post(m_strand, [self = shared_from_this()] { self->doDisconnect(); });
}

void Connection::close() {
	asio::post(m_strand, [self = shared_from_this()] {
		self->m_closeAfterWrite = true;
		if (!self->m_writeInProgress) {
			self->doDisconnect();
		}
	});
}

bool Connection::send(const Message& msg) {
	if (!m_running.load()) {
		return false;
	}
	if (msg.size() >= MAX_PAYLOAD_BYTES) {
		Logger().Log(Logging::LogLevel::Warning, std::format("[Connection] Message of {} bytes to '{}' exceeds the frame limit. Dropped.", msg.size(), m_connectionId));
		return false;
	}

	asio::post(m_strand, [self = shared_from_this(), framed = msg + MESSAGE_DELIMITER]() mutable {
		if (self->m_closeAfterWrite) {
			return;
		}
		self->m_writeQueue.push_back(std::move(framed));
		if (!self->m_writeInProgress) {
			self->startWrite();
		}
	});
	return true;
}

ConnectionId Connection::connectionId() const {
	return m_connectionId;
}

void Connection::startWrite() {
	if (!m_running || m_writeQueue.empty()) {
		m_writeInProgress = false;
		if (m_closeAfterWrite) {
			doDisconnect();
		}
		return;
	}

	m_writeInProgress = true;
	asio::async_write(m_socket, asio::buffer(m_writeQueue.front()), asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t) {
		                  if (ec || !self->m_running) {
			                  self->m_writeInProgress = false;
			                  self->doDisconnect();
			                  return;
		                  }

		                  self->m_writeQueue.pop_front();
		                  self->startWrite();
	                  }));
}

void Connection::startRead() {
	armIdleTimer();

	asio::async_read_until(m_socket, m_readBuffer, MESSAGE_DELIMITER, asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec, std::size_t bytes) {
		                       if (ec || !self->m_running) {
			                       // EOF, reset, closed by us or line longer than MAX_PAYLOAD_BYTES.
			                       if (ec && ec != asio::error::eof && ec != asio::error::operation_aborted) {
				                       Logger().Log(Logging::LogLevel::Debug, std::format("[Connection] Read on '{}' failed: {}.", self->m_connectionId, ec.message()));
			                       }
			                       self->doDisconnect();
			                       return;
		                       }

		                       const auto begin = asio::buffers_begin(self->m_readBuffer.data());
		                       Message line(begin, begin + static_cast<std::ptrdiff_t>(bytes - 1)); // Strip delimiter.
		                       self->m_readBuffer.consume(bytes);
		                       if (!line.empty() && line.back() == '\r') {
			                       line.pop_back();
		                       }

		                       if (!line.empty() && self->m_callbacks.onMessage) {
			                       self->m_callbacks.onMessage(*self, line);
		                       }
		                       if (self->m_running) {
			                       self->startRead();
		                       }
	                       }));
}

void Connection::armIdleTimer() {
	if (m_idleTimeout.count() == 0) {
		return;
	}

	// Re-arming cancels the pending wait, which then completes with operation_aborted.
	m_idleTimer.expires_after(m_idleTimeout);
	m_idleTimer.async_wait(asio::bind_executor(m_strand, [self = shared_from_this()](asio::error_code ec) {
		if (ec || !self->m_running) {
			return;
		}
		Logger().Log(Logging::LogLevel::Warning, std::format("[Connection] Connection '{}' idle for {}s. Closing.", self->m_connectionId, self->m_idleTimeout.count()));
		self->doDisconnect();
	}));
}

void Connection::doDisconnect() {
	if (!m_running.exchange(false)) {
		return;
	}

	asio::error_code ec;
	m_idleTimer.cancel();
	m_socket.shutdown(asio::socket_base::shutdown_both, ec);
	m_socket.close(ec);
	m_writeQueue.clear();

	if (m_callbacks.onDisconnect) {
		m_callbacks.onDisconnect(*this);
	}
}

} // namespace noughts::network::core
