#include <rtlife/GenerationEngine.hpp>

namespace rtlife {

unsigned char GenerationEngine::count_alive_neighbors(const GridState& grid, unsigned long x, unsigned long y)
{
	const long cx = static_cast<long>(x);
	const long cy = static_cast<long>(y);
	unsigned char alive_neighbors = 0;
	for (long dy = -1; dy <= 1; dy++) {
		for (long dx = -1; dx <= 1; dx++) {
			if (dx == 0 && dy == 0) {
				continue;
			}
			alive_neighbors += grid.get_wrapped(cx + dx, cy + dy);
		}
	}
	return alive_neighbors;
}

bool GenerationEngine::is_alive_after_evolution(bool alive, unsigned char alive_neighbors)
{
	return alive_neighbors == 3 || (alive && alive_neighbors == 2);
}

GridState GenerationEngine::compute_next(const GridState& grid)
{
	GridState next{grid.get_cols(), grid.get_rows()};
	for (auto y = 0UL; y < grid.get_rows(); y++) {
		for (auto x = 0UL; x < grid.get_cols(); x++) {
			const bool alive = grid.get(x, y);
			if (is_alive_after_evolution(alive, count_alive_neighbors(grid, x, y))) {
				next.set(x, y, true);
			}
		}
	}
	return next;
}

}
