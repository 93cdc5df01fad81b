#include <cstdlib>
#include <iostream>
#include <random>
#include <string>
#include <vector>
#include <argparse/argparse.hpp>
#include <mimalloc.h>
#include <mimalloc-new-delete.h>
#include <rtlife/Config.hpp>
#include <rtlife/CursesFrontend.hpp>
#include <rtlife/Errors.hpp>
#include <rtlife/GridState.hpp>
#include <rtlife/Log.hpp>
#include <rtlife/SimulationController.hpp>

using namespace rtlife;

static GridState initial_grid(const Config& config)
{
	const auto cols = static_cast<unsigned long>(config.cols);
	const auto rows = static_cast<unsigned long>(config.rows);
	if (config.seed) {
		std::mt19937 generator(*config.seed);
		return GridState::initialize_random(cols, rows, config.live_probability, generator);
	}
	return GridState::initialize_random(cols, rows, config.live_probability);
}

int main(int argc, char **argv)
{
	argparse::ArgumentParser program{"rtlife"};
	setup_parser(program);

	Config config;
	try {
		parse_arguments(program, std::vector<std::string>(argv, argv + argc));
		config = config_from_arguments(program);
	} catch (const ConfigurationError& err) {
		std::cerr << "invalid configuration: " << err.what() << std::endl;
		std::cerr << program;
		return EXIT_FAILURE;
	}

	if (!Log::open_file(config.log_file)) {
		std::cerr << "cannot open log file " << config.log_file << ", logging to standard error" << std::endl;
	}
	RTLIFE_INFO("starting with " << config);

	int ret = EXIT_SUCCESS;
	try {
		CursesFrontend frontend{config.layout()};
		SimulationController controller{config, frontend, initial_grid(config), SteadyClock::now()};
		controller.run();
	} catch (const std::exception& err) {
		RTLIFE_ERROR(err.what());
		std::cerr << err.what() << std::endl;
		ret = EXIT_FAILURE;
	}

	return ret;
}
