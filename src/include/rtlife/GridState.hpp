#ifndef RTLIFE_GRIDSTATE_H
#define RTLIFE_GRIDSTATE_H

#include <ostream>
#include <random>
#include <vector>
#include <mimalloc.h>

#define RTLIFE_CELL_ALIVE	1
#define RTLIFE_CELL_DEAD	0
#define RTLIFE_CELL_HOLDER	std::vector<unsigned char, mi_stl_allocator<unsigned char>>

namespace rtlife {

// Fixed-size grid of live/dead cells, stored row-major (index = y * cols + x).
class GridState
{
private:
	unsigned long cols_;
	unsigned long rows_;
	RTLIFE_CELL_HOLDER cells_;

	unsigned long coords_to_index(unsigned long x, unsigned long y) const;
	void check_bounds(unsigned long x, unsigned long y) const;

public:
	// All cells dead. Throws std::invalid_argument if either dimension is zero.
	GridState(unsigned long cols, unsigned long rows);

	static GridState initialize_random(unsigned long cols, unsigned long rows, double live_probability);
	static GridState initialize_random(unsigned long cols, unsigned long rows, double live_probability,
										std::mt19937& generator);

	unsigned long get_cols() const;
	unsigned long get_rows() const;

	// Bounds checked, throw OutOfBounds.
	bool get(unsigned long x, unsigned long y) const;
	void set(unsigned long x, unsigned long y, bool alive);
	void toggle(unsigned long x, unsigned long y);

	// Neighbor lookup: coordinates wrap around both edges.
	bool get_wrapped(long x, long y) const;

	unsigned long live_count() const;
	const RTLIFE_CELL_HOLDER& get_cells() const;

	bool operator==(const GridState& other) const;
	bool operator!=(const GridState& other) const;
	friend std::ostream& operator<<(std::ostream& os, const GridState& grid);
};

}

#endif
