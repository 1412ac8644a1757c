#pragma once

namespace noughts {

//! Cell address on the board. Signed so that out of range requests survive decoding and get rejected by the rules.
struct Coord {
	int row, col;

	bool operator==(const Coord&) const = default;
};

} // namespace noughts
