#include "core/rules.hpp"

#include <array>

namespace noughts {

using Line = std::array<Coord, Board::SIZE>;

//! 3 rows, 3 columns, 2 diagonals.
static constexpr std::array<Line, 8> kLines{{
        {{{0, 0}, {0, 1}, {0, 2}}},
        {{{1, 0}, {1, 1}, {1, 2}}},
        {{{2, 0}, {2, 1}, {2, 2}}},
        {{{0, 0}, {1, 0}, {2, 0}}},
        {{{0, 1}, {1, 1}, {2, 1}}},
        {{{0, 2}, {1, 2}, {2, 2}}},
        {{{0, 0}, {1, 1}, {2, 2}}},
        {{{0, 2}, {1, 1}, {2, 0}}},
}};

static std::optional<Symbol> lineOwner(const Board& board, const Line& line) {
	const auto first = board.get(line[0]);
	if (first == Board::Cell::Empty) {
		return std::nullopt;
	}
	for (const auto& c: line) {
		if (board.get(c) != first) {
			return std::nullopt;
		}
	}
	return first == Board::Cell::X ? Symbol::X : Symbol::O;
}

std::optional<Symbol> findWinner(const Board& board) {
	for (const auto& line: kLines) {
		if (const auto owner = lineOwner(board, line)) {
			return owner;
		}
	}
	return std::nullopt;
}

Evaluation evaluate(const Board& board) {
	if (const auto winner = findWinner(board)) {
		return {.outcome = Outcome::Won, .winner = winner};
	}
	if (board.isFull()) {
		return {.outcome = Outcome::Draw, .winner = std::nullopt};
	}
	return {.outcome = Outcome::Ongoing, .winner = std::nullopt};
}

MoveError checkPlacement(const Board& board, Coord c) {
	if (!Board::inBounds(c)) {
		return MoveError::OutOfBounds;
	}
	if (!board.isEmpty(c)) {
		return MoveError::CellOccupied;
	}
	return MoveError::None;
}

} // namespace noughts
