#pragma once

#include "model/coordinate.hpp"
#include "model/symbol.hpp"

#include <array>
#include <cstddef>

namespace noughts {

//! The 3x3 tic-tac-toe grid.
//! \note Row 0 is the top row, column 0 the left column.
class Board {
public:
	enum class Cell { Empty = 0, X = static_cast<int>(Symbol::X), O = static_cast<int>(Symbol::O) };

	static constexpr std::size_t SIZE = 3u;

public:
	Board() = default;

	static bool inBounds(Coord c); //!< True if c addresses a cell of the board.

	bool place(Coord c, Cell value); //!< Try to place a mark at the given coordinate. False if not free.

	Cell get(Coord c) const;     //!< Get the mark at the given position.
	bool isEmpty(Coord c) const; //!< True if the given coordinate is empty.
	bool isFull() const;         //!< True if no empty cell is left.

	bool operator==(const Board&) const = default;

private:
	std::array<Cell, SIZE * SIZE> m_cells{}; //!< Row major cell data.
};

//! Maps a symbol to a board cell.
inline constexpr Board::Cell toCell(const Symbol symbol) {
	return symbol == Symbol::O ? Board::Cell::O : Board::Cell::X;
}

} // namespace noughts
