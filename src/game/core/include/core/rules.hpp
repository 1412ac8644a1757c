#pragma once

#include "model/board.hpp"
#include "model/coordinate.hpp"
#include "model/symbol.hpp"

#include <optional>

namespace noughts {

enum class Outcome { Ongoing, Won, Draw };

//! Result of evaluating a board position.
struct Evaluation {
	Outcome outcome{Outcome::Ongoing};
	std::optional<Symbol> winner; //!< Set for Outcome::Won.

	bool operator==(const Evaluation&) const = default;
};

//! Why a move request was refused.
enum class MoveError {
	None,        //!< Move is legal.
	NotYourTurn, //!< Requester does not hold the turn or the game is over.
	OutOfBounds, //!< Position outside of [0,2]x[0,2].
	CellOccupied //!< Target cell already holds a mark.
};

//! Returns the symbol owning a complete row, column or diagonal. Empty if no line is complete.
std::optional<Symbol> findWinner(const Board& board);

//! Classify a position as ongoing, won or drawn.
//! \note Pure function. Safe to call on any snapshot without synchronisation.
Evaluation evaluate(const Board& board);

//! Local placement check (bounds and occupancy). Turn order is the session's business.
MoveError checkPlacement(const Board& board, Coord c);

} // namespace noughts
