#include <filesystem>
#include <fstream>
#include <iterator>
#include <sstream>
#include <system_error>
#include <rtlife/Errors.hpp>
#include <rtlife/PersistenceAdapter.hpp>

namespace fs = std::filesystem;

namespace rtlife {

std::string PersistenceAdapter::serialize(const GridState& grid)
{
	std::ostringstream outstream;
	outstream << RTLIFE_STATE_MAGIC << " " << grid.get_cols() << " " << grid.get_rows() << "\n";
	std::string bytes = outstream.str();
	bytes.reserve(bytes.size() + grid.get_cells().size());
	for (auto cell : grid.get_cells()) {
		bytes.push_back(static_cast<char>(cell == RTLIFE_CELL_ALIVE ? RTLIFE_STATE_ALIVE_BYTE : RTLIFE_STATE_DEAD_BYTE));
	}
	return bytes;
}

GridState PersistenceAdapter::deserialize(const std::string& bytes)
{
	const auto header_end = bytes.find('\n');
	if (header_end == std::string::npos) {
		throw CorruptData("saved state has no header line");
	}

	std::istringstream iss(bytes.substr(0, header_end));
	std::string magic;
	iss >> magic;
	if (magic != RTLIFE_STATE_MAGIC) {
		throw CorruptData("unrecognised saved state format tag '" + magic + "'");
	}
	long long cols = 0, rows = 0;
	std::string trailing;
	if (!(iss >> cols >> rows) || (iss >> trailing)) {
		throw CorruptData("malformed saved state header");
	}
	if (cols <= 0 || rows <= 0) {
		throw CorruptData("saved state has non-positive dimensions "
			+ std::to_string(cols) + "x" + std::to_string(rows));
	}

	const auto payload_length = bytes.size() - header_end - 1;
	const auto ucols = static_cast<unsigned long long>(cols);
	const auto urows = static_cast<unsigned long long>(rows);
	if (ucols > payload_length / urows || ucols * urows != payload_length) {
		throw CorruptData("saved state payload holds " + std::to_string(payload_length)
			+ " cells, header declares " + std::to_string(cols) + "x" + std::to_string(rows));
	}

	GridState grid{static_cast<unsigned long>(cols), static_cast<unsigned long>(rows)};
	auto i = header_end + 1;
	for (auto y = 0UL; y < grid.get_rows(); y++) {
		for (auto x = 0UL; x < grid.get_cols(); x++, i++) {
			const auto value = static_cast<unsigned char>(bytes[i]);
			if (value == RTLIFE_STATE_ALIVE_BYTE) {
				grid.set(x, y, true);
			} else if (value != RTLIFE_STATE_DEAD_BYTE) {
				throw CorruptData("invalid cell value " + std::to_string(value)
					+ " at (" + std::to_string(x) + ", " + std::to_string(y) + ")");
			}
		}
	}
	return grid;
}

void PersistenceAdapter::save(const GridState& grid, const std::string& filename)
{
	const std::string bytes = serialize(grid);
	const std::string temporary = filename + ".tmp";
	{
		std::ofstream outstream{temporary.c_str(), std::ios_base::binary | std::ios_base::trunc};
		if (!outstream) {
			throw fs::filesystem_error("cannot open for writing", fs::path{temporary},
				std::make_error_code(std::errc::io_error));
		}
		outstream.write(bytes.data(), static_cast<std::streamsize>(bytes.size()));
		outstream.close();
		if (!outstream) {
			fs::remove(temporary);
			throw fs::filesystem_error("cannot write saved state", fs::path{temporary},
				std::make_error_code(std::errc::io_error));
		}
	}
	fs::rename(temporary, filename);
}

GridState PersistenceAdapter::load(const std::string& filename)
{
	std::error_code ec;
	if (!fs::is_regular_file(filename, ec)) {
		throw NotFound(filename);
	}
	std::ifstream instream(filename.c_str(), std::ios_base::binary);
	if (!instream) {
		throw CorruptData("cannot read saved state " + filename);
	}
	const std::string bytes{std::istreambuf_iterator<char>(instream), std::istreambuf_iterator<char>()};
	if (instream.bad()) {
		throw CorruptData("error while reading saved state " + filename);
	}
	return deserialize(bytes);
}

std::string PersistenceAdapter::state_filename(const std::string& base)
{
	const std::string extension{RTLIFE_STATE_EXTENSION};
	if (base.size() >= extension.size()
		&& base.compare(base.size() - extension.size(), extension.size(), extension) == 0) {
		return base;
	}
	return base + extension;
}

void PersistenceAdapter::export_pgm(const GridState& grid, const std::string& filename)
{
	const fs::path path{filename};
	if (path.has_parent_path()) {
		fs::create_directories(path.parent_path());
	}
	std::ofstream outstream{filename.c_str(), std::ios_base::binary | std::ios_base::trunc};
	if (!outstream) {
		throw fs::filesystem_error("cannot open for writing", path, std::make_error_code(std::errc::io_error));
	}
	outstream << "P5 " << grid.get_cols() << " " << grid.get_rows() << " " << PGM_MAX_VALUE << "\n";
	std::string raster(grid.get_cells().size(), static_cast<char>(PGM_DEAD_VALUE));
	for (auto i = 0UL; i < raster.size(); i++) {
		if (grid.get_cells()[i] == RTLIFE_CELL_ALIVE) {
			raster[i] = static_cast<char>(PGM_ALIVE_VALUE);
		}
	}
	outstream.write(raster.data(), static_cast<std::streamsize>(raster.size()));
	outstream.close();
	if (!outstream) {
		throw fs::filesystem_error("cannot write snapshot", path, std::make_error_code(std::errc::io_error));
	}
}

std::string PersistenceAdapter::snapshot_filename(const std::string& directory, unsigned long generation)
{
	std::string suffix = std::to_string(generation);
	if (suffix.size() < 5) {
		suffix.insert(0, 5 - suffix.size(), '0');
	}
	return (fs::path{directory} / ("snapshot_" + suffix + ".pgm")).string();
}

}
