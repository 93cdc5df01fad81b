#include <rtlife/Errors.hpp>

namespace rtlife {

static std::string describe_coordinates(unsigned long x, unsigned long y, unsigned long cols, unsigned long rows)
{
	return "cell (" + std::to_string(x) + ", " + std::to_string(y) + ") is outside the "
		+ std::to_string(cols) + "x" + std::to_string(rows) + " grid";
}

OutOfBounds::OutOfBounds(unsigned long x, unsigned long y, unsigned long cols, unsigned long rows):
std::out_of_range{describe_coordinates(x, y, cols, rows)},
x_{x},
y_{y}
{}

unsigned long OutOfBounds::get_x() const
{
	return x_;
}

unsigned long OutOfBounds::get_y() const
{
	return y_;
}

NotFound::NotFound(const std::string& path):
std::runtime_error{"no saved state at " + path},
path_{path}
{}

const std::string& NotFound::get_path() const
{
	return path_;
}

CorruptData::CorruptData(const std::string& what):
std::runtime_error{what}
{}

ConfigurationError::ConfigurationError(const std::string& what):
std::invalid_argument{what}
{}

}
