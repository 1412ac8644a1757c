#pragma once

#include "model/player.hpp"

#include <array>
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string_view>

namespace noughts::network {

using SessionId = noughts::SessionId;

//! Codes carried by error messages and failed move acknowledgements.
enum class ErrorCode : std::uint8_t {
	InvalidJson,   //!< Line is not a JSON object.
	UnknownType,   //!< Missing or unsupported message type.
	MissingData,   //!< Required field missing or of wrong type.
	InvalidGame,   //!< Unknown or finished game id.
	NotInGame,     //!< Requester has not joined or is no participant of the game.
	AlreadyJoined, //!< Join while waiting or playing.
	InvalidMove,   //!< Occupied cell or position out of bounds.
	NotYourTurn,   //!< Move out of turn or after the game ended.
	ServerFull,    //!< Connection limit reached.
	Count          //!< Used in serialisation to check when enum changes.
};

inline constexpr std::array<std::string_view, static_cast<std::size_t>(ErrorCode::Count)> ERROR_CODE_NAMES{
        "invalid_json", "unknown_type", "missing_data", "invalid_game", "not_in_game", "already_joined", "invalid_move", "not_your_turn", "server_full",
};

inline constexpr std::string_view toString(ErrorCode code) {
	return ERROR_CODE_NAMES[static_cast<std::size_t>(code)];
}

inline constexpr std::optional<ErrorCode> errorCodeFromString(std::string_view name) {
	for (std::size_t i = 0; i != ERROR_CODE_NAMES.size(); ++i) {
		if (ERROR_CODE_NAMES[i] == name) {
			return static_cast<ErrorCode>(i);
		}
	}
	return std::nullopt;
}

enum class JoinStatus : std::uint8_t { Waiting, Success };

//! Value of the winner field when the board filled up without a line.
inline constexpr char WINNER_DRAW[] = "draw";

} // namespace noughts::network
