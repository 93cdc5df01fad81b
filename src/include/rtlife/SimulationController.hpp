#ifndef RTLIFE_SIMULATIONCONTROLLER_H
#define RTLIFE_SIMULATIONCONTROLLER_H

#include <string>
#include <vector>
#include <rtlife/Config.hpp>
#include <rtlife/Frontend.hpp>
#include <rtlife/GridState.hpp>
#include <rtlife/InputTranslator.hpp>
#include <rtlife/SimulationClock.hpp>

namespace rtlife {

/*
 * Owns the grid and the clock and runs the frame loop: drain input, apply
 * commands in arrival order, advance if a tick is due, render, sleep.
 *
 * Until the proceed key arrives the controller shows instructions and only
 * honors Proceed and Quit. A manual advance does not restart the automatic
 * tick interval.
 */
class SimulationController
{
private:
	Config config_;
	Frontend& frontend_;
	InputTranslator translator_;
	GridState grid_;
	SimulationClock clock_;
	Phase phase_;
	bool running_;
	unsigned long generation_;
	std::string status_;
	std::vector<std::string> instructions_;

	void next_generation();
	void save_state();
	void load_state();
	void export_snapshot();

public:
	SimulationController(const Config& config, Frontend& frontend, GridState initial_grid, TimePoint start);

	// Translates and applies every event in order.
	void handle_events(const std::vector<RawEvent>& events, TimePoint now);
	void apply(const Command& command, TimePoint now);
	// Advances one generation if the clock says a tick is due. Returns whether it did.
	bool update(TimePoint now);
	void render();
	// One frame without the frame-rate sleep.
	void frame(TimePoint now);
	// Frames until Quit.
	void run();

	const GridState& get_grid() const;
	const SimulationClock& get_clock() const;
	Phase get_phase() const;
	bool is_running() const;
	unsigned long get_generation() const;
	const std::string& get_status() const;
	std::string state_path() const;
};

}

#endif
