#include <algorithm>
#include <stdexcept>
#include <rtlife/Errors.hpp>
#include <rtlife/GridState.hpp>

namespace rtlife {

GridState::GridState(unsigned long cols, unsigned long rows):
cols_{cols},
rows_{rows},
cells_{}
{
	if (cols_ == 0 || rows_ == 0) {
		throw std::invalid_argument("grid dimensions must be positive, got "
			+ std::to_string(cols_) + "x" + std::to_string(rows_));
	}
	cells_.resize(cols_ * rows_, RTLIFE_CELL_DEAD);
}

GridState GridState::initialize_random(unsigned long cols, unsigned long rows, double live_probability)
{
	std::random_device rd;
	std::mt19937 generator(rd());
	return initialize_random(cols, rows, live_probability, generator);
}

GridState GridState::initialize_random(unsigned long cols, unsigned long rows, double live_probability,
										std::mt19937& generator)
{
	if (!(live_probability >= 0.0 && live_probability <= 1.0)) {
		throw std::invalid_argument("live probability must lie in [0, 1], got " + std::to_string(live_probability));
	}
	GridState grid{cols, rows};
	std::bernoulli_distribution distribution(live_probability);
	for (auto& cell : grid.cells_) {
		cell = distribution(generator) ? RTLIFE_CELL_ALIVE : RTLIFE_CELL_DEAD;
	}
	return grid;
}

unsigned long GridState::get_cols() const
{
	return cols_;
}

unsigned long GridState::get_rows() const
{
	return rows_;
}

inline unsigned long GridState::coords_to_index(unsigned long x, unsigned long y) const
{
	return y * cols_ + x;
}

void GridState::check_bounds(unsigned long x, unsigned long y) const
{
	if (x >= cols_ || y >= rows_) {
		throw OutOfBounds(x, y, cols_, rows_);
	}
}

bool GridState::get(unsigned long x, unsigned long y) const
{
	check_bounds(x, y);
	return cells_[coords_to_index(x, y)] == RTLIFE_CELL_ALIVE;
}

void GridState::set(unsigned long x, unsigned long y, bool alive)
{
	check_bounds(x, y);
	cells_[coords_to_index(x, y)] = alive ? RTLIFE_CELL_ALIVE : RTLIFE_CELL_DEAD;
}

void GridState::toggle(unsigned long x, unsigned long y)
{
	check_bounds(x, y);
	auto& cell = cells_[coords_to_index(x, y)];
	cell = (cell == RTLIFE_CELL_ALIVE) ? RTLIFE_CELL_DEAD : RTLIFE_CELL_ALIVE;
}

bool GridState::get_wrapped(long x, long y) const
{
	const long cols = static_cast<long>(cols_);
	const long rows = static_cast<long>(rows_);
	const unsigned long wrapped_x = static_cast<unsigned long>(((x % cols) + cols) % cols);
	const unsigned long wrapped_y = static_cast<unsigned long>(((y % rows) + rows) % rows);
	return cells_[coords_to_index(wrapped_x, wrapped_y)] == RTLIFE_CELL_ALIVE;
}

unsigned long GridState::live_count() const
{
	return std::count(cells_.begin(), cells_.end(), RTLIFE_CELL_ALIVE);
}

const RTLIFE_CELL_HOLDER& GridState::get_cells() const
{
	return cells_;
}

bool GridState::operator==(const GridState& other) const
{
	return cols_ == other.cols_ && rows_ == other.rows_ && cells_ == other.cells_;
}

bool GridState::operator!=(const GridState& other) const
{
	return !(*this == other);
}

std::ostream& operator<<(std::ostream& os, const GridState& grid)
{
	os << "Grid " << grid.cols_ << "x" << grid.rows_ << ", " << grid.live_count() << " alive" << "\n";
	for (auto y = 0UL; y < grid.rows_; y++) {
		for (auto x = 0UL; x < grid.cols_; x++) {
			os << (grid.get(x, y) ? 'o' : '.');
		}
		os << "\n";
	}
	return os;
}

}
