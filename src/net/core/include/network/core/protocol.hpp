#pragma once

#include <cstddef>
#include <cstdint>

#include <string>

namespace noughts {
namespace network {
namespace core {

using ConnectionId = std::uint32_t; //!< Identifies a connection on network layer.
using Message      = std::string;   //!< One JSON document, without the delimiter.

inline constexpr char DEFAULT_HOST[]                = "127.0.0.1";
inline constexpr std::uint16_t DEFAULT_PORT         = 65432;
inline constexpr std::size_t DEFAULT_WORKERS        = 10;  //!< IO threads serving connections.
inline constexpr std::size_t DEFAULT_MAX_CONNECTION = 64;  //!< Connections beyond this are refused.
inline constexpr unsigned DEFAULT_IDLE_TIMEOUT_S    = 300; //!< Silent connections are closed after this. 0 disables.

//! Messages are newline delimited on the wire.
inline constexpr char MESSAGE_DELIMITER = '\n';

//! Maximum line length we are willing to buffer. Longer lines close the connection.
inline constexpr std::size_t MAX_PAYLOAD_BYTES = 4 * 1024;

// Limits on client supplied text that the server repeats in its replies.
inline constexpr std::size_t MAX_USERNAME_BYTES = 64;
inline constexpr std::size_t MAX_AVATAR_BYTES   = 256;
inline constexpr std::size_t MAX_CHAT_BYTES     = 512;

//! JSON escapes a control character to six bytes. A chat broadcast carries a username and a chat text.
static_assert(6 * (MAX_USERNAME_BYTES + MAX_CHAT_BYTES) + 256 < MAX_PAYLOAD_BYTES, "Largest reply must fit into one frame.");

} // namespace core
} // namespace network
} // namespace noughts
