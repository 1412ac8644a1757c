#pragma once

namespace noughts {

enum class GameStatus {
	InProgress, //!< Moves are accepted.
	Won,        //!< A participant completed a line.
	Draw,       //!< Board full without a line.
	Abandoned   //!< A participant quit or disconnected.
};

inline constexpr bool isTerminal(GameStatus status) {
	return status != GameStatus::InProgress;
}

} // namespace noughts
