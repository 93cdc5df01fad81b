#include <fstream>
#include <iostream>
#include <rtlife/Log.hpp>

namespace rtlife {

static std::ofstream& log_file()
{
	static std::ofstream file;
	return file;
}

std::ostream& Log::stream()
{
	if (log_file().is_open()) {
		return log_file();
	}
	return std::clog;
}

bool Log::open_file(const std::string& filename)
{
	if (log_file().is_open()) {
		log_file().close();
	}
	if (filename.empty()) {
		return true;
	}
	log_file().open(filename.c_str(), std::ios_base::out | std::ios_base::app);
	return log_file().is_open();
}

}
