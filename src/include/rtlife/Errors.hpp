#ifndef RTLIFE_ERRORS_H
#define RTLIFE_ERRORS_H

#include <stdexcept>
#include <string>

namespace rtlife {

// A cell coordinate outside the grid.
class OutOfBounds : public std::out_of_range
{
public:
	OutOfBounds(unsigned long x, unsigned long y, unsigned long cols, unsigned long rows);
	unsigned long get_x() const;
	unsigned long get_y() const;

private:
	unsigned long x_, y_;
};

// A load was requested but there is no saved state at the given path.
class NotFound : public std::runtime_error
{
public:
	explicit NotFound(const std::string& path);
	const std::string& get_path() const;

private:
	std::string path_;
};

// A saved state that cannot be turned into a consistent grid.
class CorruptData : public std::runtime_error
{
public:
	explicit CorruptData(const std::string& what);
};

// Rejected startup configuration. Fatal, raised before the loop starts.
class ConfigurationError : public std::invalid_argument
{
public:
	explicit ConfigurationError(const std::string& what);
};

}

#endif
