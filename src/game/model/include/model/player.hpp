#pragma once

#include <cstdint>
#include <string>

namespace noughts {

using PlayerId         = std::uint32_t; //!< Identifies a registered player on application layer.
using SessionId        = std::string;   //!< Opaque game identifier handed out to clients.
using ConnectionHandle = std::uint32_t; //!< Transport handle of the connection a player talks through.

//! Identity of a registered player. Independent of session membership.
struct PlayerInfo {
	PlayerId id{0u};
	std::string name;   //!< Display name, never empty.
	std::string avatar; //!< Optional client supplied avatar. Empty if none.
};

} // namespace noughts
