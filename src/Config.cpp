#include <cmath>
#include <cstring>
#include <rtlife/Config.hpp>
#include <rtlife/Errors.hpp>

namespace rtlife {

long long tick_interval_millis(const Config& config)
{
	return std::llround(config.tick_interval * 1000);
}

Layout Config::layout() const
{
	return Layout::compute(width, height, static_cast<unsigned long>(cols), static_cast<unsigned long>(rows),
							static_cast<int>(std::strlen(RTLIFE_BUTTON_LABEL)), 1);
}

std::ostream& operator<<(std::ostream& os, const Config& config)
{
	os << "window " << config.width << "x" << config.height
		<< ", grid " << config.cols << "x" << config.rows
		<< ", live probability " << config.live_probability
		<< ", tick interval " << config.tick_interval << " s"
		<< ", " << config.frame_rate << " fps"
		<< ", state file " << PersistenceAdapter::state_filename(config.state_file)
		<< ", snapshots in " << config.snapshot_dir;
	if (config.seed) {
		os << ", seed " << *config.seed;
	}
	return os;
}

void setup_parser(argparse::ArgumentParser& program)
{
	const Config defaults;

	program.add_argument("--width")
		.default_value(defaults.width)
		.scan<'i', int>()
		.help("window width in pixels");

	program.add_argument("--height")
		.default_value(defaults.height)
		.scan<'i', int>()
		.help("window height in pixels");

	program.add_argument("--cols")
		.default_value(defaults.cols)
		.scan<'i', int>()
		.help("grid columns");

	program.add_argument("--rows")
		.default_value(defaults.rows)
		.scan<'i', int>()
		.help("grid rows");

	program.add_argument("-p", "--probability")
		.default_value(defaults.live_probability)
		.scan<'g', double>()
		.help("probability of a cell starting alive");

	program.add_argument("-t", "--interval")
		.default_value(defaults.tick_interval)
		.scan<'g', double>()
		.help("seconds between generations");

	program.add_argument("--fps")
		.default_value(defaults.frame_rate)
		.scan<'i', int>()
		.help("frame rate cap");

	program.add_argument("-f", "--state-file")
		.default_value(defaults.state_file)
		.help("saved state file name, " RTLIFE_STATE_EXTENSION " is appended");

	program.add_argument("--snapshot-dir")
		.default_value(defaults.snapshot_dir)
		.help("directory for exported PGM snapshots");

	program.add_argument("--log-file")
		.default_value(defaults.log_file)
		.help("log file, empty for standard error");

	program.add_argument("--seed")
		.scan<'u', unsigned int>()
		.help("seed for the initial grid");
}

void parse_arguments(argparse::ArgumentParser& program, const std::vector<std::string>& arguments)
{
	try {
		program.parse_args(arguments);
	} catch (const std::exception& err) {
		// argparse throws std::runtime_error for bad usage, std::invalid_argument
		// and std::range_error when a value fails to scan
		throw ConfigurationError(err.what());
	}
}

Config config_from_arguments(const argparse::ArgumentParser& program)
{
	Config config;
	config.width = program.get<int>("--width");
	config.height = program.get<int>("--height");
	config.cols = program.get<int>("--cols");
	config.rows = program.get<int>("--rows");
	config.live_probability = program.get<double>("--probability");
	config.tick_interval = program.get<double>("--interval");
	config.frame_rate = program.get<int>("--fps");
	config.state_file = program.get<std::string>("--state-file");
	config.snapshot_dir = program.get<std::string>("--snapshot-dir");
	config.log_file = program.get<std::string>("--log-file");
	config.seed = program.present<unsigned int>("--seed");
	validate(config);
	return config;
}

void validate(const Config& config)
{
	if (config.cols <= 0 || config.rows <= 0) {
		throw ConfigurationError("grid dimensions must be positive, got "
			+ std::to_string(config.cols) + "x" + std::to_string(config.rows));
	}
	if (config.width < config.cols || config.height < config.rows) {
		throw ConfigurationError("a " + std::to_string(config.width) + "x" + std::to_string(config.height)
			+ " window cannot fit " + std::to_string(config.cols) + "x" + std::to_string(config.rows)
			+ " cells of at least one pixel");
	}
	if (!(config.live_probability >= 0.0 && config.live_probability <= 1.0)) {
		throw ConfigurationError("live probability must lie in [0, 1], got " + std::to_string(config.live_probability));
	}
	if (!(config.tick_interval > 0.0) || !std::isfinite(config.tick_interval)) {
		throw ConfigurationError("tick interval must be positive, got " + std::to_string(config.tick_interval));
	}
	if (tick_interval_millis(config) < 1) {
		throw ConfigurationError("tick interval must be at least 1 ms, got " + std::to_string(config.tick_interval) + " s");
	}
	if (config.frame_rate <= 0) {
		throw ConfigurationError("frame rate must be positive, got " + std::to_string(config.frame_rate));
	}
	if (config.state_file.empty()) {
		throw ConfigurationError("state file name must not be empty");
	}
}

}
