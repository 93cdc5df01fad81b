#include <filesystem>
#include <utility>
#include <rtlife/Errors.hpp>
#include <rtlife/GenerationEngine.hpp>
#include <rtlife/Log.hpp>
#include <rtlife/PersistenceAdapter.hpp>
#include <rtlife/SimulationController.hpp>

namespace fs = std::filesystem;

namespace rtlife {

static std::vector<std::string> instruction_lines(const KeyBindings& keys)
{
	auto key_name = [](int key) -> std::string {
		if (key == ' ') {
			return "space";
		} else if (key == RTLIFE_KEY_ENTER) {
			return "enter";
		}
		return std::string(1, static_cast<char>(key));
	};
	return {
		"Welcome to the Game of Life",
		"Instructions:",
		"- Click 'Next Generation' to advance one generation.",
		"- Click a cell to bring it to life or kill it.",
		"- Press " + key_name(keys.pause) + " to pause or resume the simulation.",
		"- Press " + key_name(keys.save) + " to save the grid, " + key_name(keys.load) + " to load it back.",
		"- Press " + key_name(keys.export_snapshot) + " to export the grid as a PGM image.",
		"- Press " + key_name(keys.quit) + " to quit.",
		"Press " + key_name(keys.proceed) + " to continue",
	};
}

static const Config& validated(const Config& config)
{
	validate(config);
	return config;
}

SimulationController::SimulationController(const Config& config, Frontend& frontend, GridState initial_grid, TimePoint start):
config_{validated(config)},
frontend_{frontend},
translator_{config_.layout(), config_.keys},
grid_{std::move(initial_grid)},
clock_{std::chrono::milliseconds(static_cast<std::chrono::milliseconds::rep>(tick_interval_millis(config_))), start},
phase_{Phase::ShowingInstructions},
running_{true},
generation_{0},
status_{},
instructions_{instruction_lines(config_.keys)}
{
	const auto layout = translator_.get_layout();
	if (grid_.get_cols() != layout.cols || grid_.get_rows() != layout.rows) {
		throw ConfigurationError("initial grid is " + std::to_string(grid_.get_cols()) + "x"
			+ std::to_string(grid_.get_rows()) + ", layout expects "
			+ std::to_string(layout.cols) + "x" + std::to_string(layout.rows));
	}
}

void SimulationController::handle_events(const std::vector<RawEvent>& events, TimePoint now)
{
	for (const auto& event : events) {
		const auto command = translator_.translate(event);
		if (command) {
			apply(*command, now);
		}
	}
}

void SimulationController::apply(const Command& command, TimePoint now)
{
	if (phase_ == Phase::ShowingInstructions) {
		if (command.type == Command::Type::Proceed) {
			phase_ = Phase::Simulating;
			clock_.reset(now);
			RTLIFE_DEBUG("instructions dismissed");
		} else if (command.type == Command::Type::Quit) {
			running_ = false;
		} else {
			RTLIFE_DEBUG("ignoring " << command << " while instructions are shown");
		}
		return;
	}

	RTLIFE_DEBUG("applying " << command);
	switch (command.type) {
	case Command::Type::ToggleCell:
		try {
			grid_.toggle(command.x, command.y);
		} catch (const OutOfBounds& err) {
			RTLIFE_WARN("ignoring toggle: " << err.what());
		}
		break;
	case Command::Type::AdvanceGeneration:
		next_generation();
		break;
	case Command::Type::TogglePause:
		clock_.toggle_pause();
		status_ = clock_.is_paused() ? "Paused" : "Resumed";
		break;
	case Command::Type::SaveState:
		save_state();
		break;
	case Command::Type::LoadState:
		load_state();
		break;
	case Command::Type::ExportSnapshot:
		export_snapshot();
		break;
	case Command::Type::Proceed:
		break;
	case Command::Type::Quit:
		running_ = false;
		break;
	}
}

bool SimulationController::update(TimePoint now)
{
	if (phase_ != Phase::Simulating || !clock_.poll(now)) {
		return false;
	}
	next_generation();
	return true;
}

void SimulationController::render()
{
	const Layout& layout = translator_.get_layout();
	const FrameView view{grid_, layout, phase_, clock_.is_paused(), generation_, status_, instructions_};
	frontend_.render(view);
}

void SimulationController::frame(TimePoint now)
{
	handle_events(frontend_.poll_events(), now);
	update(now);
	render();
}

void SimulationController::run()
{
	FrameLimiter limiter{static_cast<unsigned int>(config_.frame_rate), SteadyClock::now()};
	while (running_) {
		frame(SteadyClock::now());
		if (running_) {
			limiter.wait();
		}
	}
	RTLIFE_INFO("quit after " << generation_ << " generations");
}

void SimulationController::next_generation()
{
	grid_ = GenerationEngine::compute_next(grid_);
	generation_++;
}

void SimulationController::save_state()
{
	const auto path = state_path();
	try {
		PersistenceAdapter::save(grid_, path);
		status_ = "Saved to " + path;
		RTLIFE_INFO("saved generation " << generation_ << " to " << path);
	} catch (const fs::filesystem_error& err) {
		status_ = "Save failed: " + std::string(err.what());
		RTLIFE_ERROR("saving " << path << " failed: " << err.what());
	}
}

void SimulationController::load_state()
{
	const auto path = state_path();
	try {
		GridState loaded = PersistenceAdapter::load(path);
		if (loaded.get_cols() != grid_.get_cols() || loaded.get_rows() != grid_.get_rows()) {
			throw CorruptData("saved grid is " + std::to_string(loaded.get_cols()) + "x"
				+ std::to_string(loaded.get_rows()) + ", running grid is "
				+ std::to_string(grid_.get_cols()) + "x" + std::to_string(grid_.get_rows()));
		}
		grid_ = std::move(loaded);
		status_ = "Loaded " + path;
		RTLIFE_INFO("loaded " << path);
	} catch (const NotFound& err) {
		status_ = "Nothing to load: " + std::string(err.what());
		RTLIFE_WARN(err.what());
	} catch (const CorruptData& err) {
		status_ = "Load failed: " + std::string(err.what());
		RTLIFE_ERROR("loading " << path << " failed: " << err.what());
	}
}

void SimulationController::export_snapshot()
{
	const auto path = PersistenceAdapter::snapshot_filename(config_.snapshot_dir, generation_);
	try {
		PersistenceAdapter::export_pgm(grid_, path);
		status_ = "Exported " + path;
		RTLIFE_INFO("exported generation " << generation_ << " to " << path);
	} catch (const fs::filesystem_error& err) {
		status_ = "Export failed: " + std::string(err.what());
		RTLIFE_ERROR("exporting " << path << " failed: " << err.what());
	}
}

const GridState& SimulationController::get_grid() const
{
	return grid_;
}

const SimulationClock& SimulationController::get_clock() const
{
	return clock_;
}

Phase SimulationController::get_phase() const
{
	return phase_;
}

bool SimulationController::is_running() const
{
	return running_;
}

unsigned long SimulationController::get_generation() const
{
	return generation_;
}

const std::string& SimulationController::get_status() const
{
	return status_;
}

std::string SimulationController::state_path() const
{
	return PersistenceAdapter::state_filename(config_.state_file);
}

}
