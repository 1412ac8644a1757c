#include "model/board.hpp"

#include <algorithm>
#include <cassert>

namespace noughts {

bool Board::inBounds(Coord c) {
	return c.row >= 0 && c.col >= 0 && c.row < static_cast<int>(SIZE) && c.col < static_cast<int>(SIZE);
}

bool Board::place(Coord c, Cell value) {
	assert(inBounds(c));         // Rules should verify valid coordinate.
	assert(value != Cell::Empty); // Cells are never cleared during a game.

	if (isEmpty(c)) {
		m_cells[static_cast<std::size_t>(c.row) * SIZE + static_cast<std::size_t>(c.col)] = value;
		return true;
	}
	return false;
}

Board::Cell Board::get(Coord c) const {
	assert(inBounds(c)); // Rules should verify valid coordinate.
	return m_cells[static_cast<std::size_t>(c.row) * SIZE + static_cast<std::size_t>(c.col)];
}

bool Board::isEmpty(Coord c) const {
	return get(c) == Cell::Empty;
}

bool Board::isFull() const {
	return std::none_of(m_cells.begin(), m_cells.end(), [](Cell cell) { return cell == Cell::Empty; });
}

} // namespace noughts
