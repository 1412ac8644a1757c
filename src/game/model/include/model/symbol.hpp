#pragma once

namespace noughts {

//! Mark a participant puts on the board. X always opens the game.
enum class Symbol { X = 1, O = 2 };

//! Returns the opponent enum value of input symbol.
inline constexpr Symbol opponent(Symbol symbol) {
	return symbol == Symbol::X ? Symbol::O : Symbol::X;
}

inline constexpr char toChar(Symbol symbol) {
	return symbol == Symbol::X ? 'X' : 'O';
}

} // namespace noughts
