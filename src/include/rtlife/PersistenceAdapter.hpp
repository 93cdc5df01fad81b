#ifndef RTLIFE_PERSISTENCEADAPTER_H
#define RTLIFE_PERSISTENCEADAPTER_H

#include <string>
#include <rtlife/GridState.hpp>

#define RTLIFE_STATE_MAGIC			"RTLIFE1"
#define RTLIFE_STATE_EXTENSION		".rtl"
#define RTLIFE_STATE_DEFAULT_NAME	"saved_game_state"
#define RTLIFE_STATE_ALIVE_BYTE		0xFF
#define RTLIFE_STATE_DEAD_BYTE		0x00

#define PGM_MAX_VALUE			255
#define PGM_ALIVE_VALUE			0
#define PGM_DEAD_VALUE			255

namespace rtlife {

/*
 * Saved state layout, modeled on binary PGM:
 *   "RTLIFE1 <cols> <rows>\n" followed by cols * rows bytes, row-major,
 *   0xFF for a live cell and 0x00 for a dead one.
 */
namespace PersistenceAdapter {

	std::string serialize(const GridState& grid);
	// Throws CorruptData.
	GridState deserialize(const std::string& bytes);

	// Whole grid or nothing: the blob goes to a temporary file that is then renamed over filename.
	void save(const GridState& grid, const std::string& filename);
	// Throws NotFound if filename does not exist, CorruptData if it does not hold a grid.
	GridState load(const std::string& filename);

	// Appends RTLIFE_STATE_EXTENSION unless base already ends with it.
	std::string state_filename(const std::string& base);

	// P5 image, one pixel per cell, live cells black.
	void export_pgm(const GridState& grid, const std::string& filename);
	// <directory>/snapshot_NNNNN.pgm
	std::string snapshot_filename(const std::string& directory, unsigned long generation);
}

}

#endif
