#ifndef LOCATION_HPP
#define LOCATION_HPP

namespace sigil {

// zero-based position inside a listing
struct Position {
	int line {0};
	int column {0};
};

struct Location {
	Position begin {};
	Position end {};
};

} // namespace sigil

#endif
