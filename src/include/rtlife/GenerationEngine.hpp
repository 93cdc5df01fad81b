#ifndef RTLIFE_GENERATIONENGINE_H
#define RTLIFE_GENERATIONENGINE_H

#include <rtlife/GridState.hpp>

namespace rtlife {

namespace GenerationEngine {

	// Live cells among the eight toroidally wrapped neighbors of (x, y).
	unsigned char count_alive_neighbors(const GridState& grid, unsigned long x, unsigned long y);
	// B3/S23.
	bool is_alive_after_evolution(bool alive, unsigned char alive_neighbors);
	// Next generation, written to a fresh grid so no cell sees an already updated neighbor.
	GridState compute_next(const GridState& grid);
}

}

#endif
