#ifndef RTLIFE_CONFIG_H
#define RTLIFE_CONFIG_H

#include <optional>
#include <ostream>
#include <string>
#include <vector>
#include <argparse/argparse.hpp>
#include <rtlife/InputTranslator.hpp>
#include <rtlife/PersistenceAdapter.hpp>

namespace rtlife {

struct Config
{
	int width = 80;				// pixels; one terminal character is one pixel
	int height = 20;
	int cols = 40;
	int rows = 20;
	double live_probability = 0.2;
	double tick_interval = 0.8;	// seconds
	int frame_rate = 10;
	std::string state_file = RTLIFE_STATE_DEFAULT_NAME;
	std::string snapshot_dir = "pics";
	std::string log_file = "rtlife.log";
	std::optional<unsigned int> seed;
	KeyBindings keys;

	Layout layout() const;
	friend std::ostream& operator<<(std::ostream& os, const Config& config);
};

void setup_parser(argparse::ArgumentParser& program);
// Runs program over arguments (program name first). Unknown options, missing
// values and values that do not scan are reported as ConfigurationError.
void parse_arguments(argparse::ArgumentParser& program, const std::vector<std::string>& arguments);
// Reads a parsed program into a Config and validates it.
Config config_from_arguments(const argparse::ArgumentParser& program);
// Tick interval rounded to whole milliseconds, the clock's resolution.
long long tick_interval_millis(const Config& config);
// Throws ConfigurationError.
void validate(const Config& config);

}

#endif
