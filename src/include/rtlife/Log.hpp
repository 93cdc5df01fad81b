#ifndef RTLIFE_LOG_H
#define RTLIFE_LOG_H

#include <ostream>
#include <string>

#define RTLIFE_LOG(level, x) \
	rtlife::Log::stream() << "[" << level << "] " << x << std::endl

#define RTLIFE_INFO(x)	RTLIFE_LOG("info", x)
#define RTLIFE_WARN(x)	RTLIFE_LOG("warn", x)
#define RTLIFE_ERROR(x)	RTLIFE_LOG("error", x)

#ifdef DEBUG
#define RTLIFE_DEBUG(x)	RTLIFE_LOG("debug", x)
#else
#define RTLIFE_DEBUG(x) do {} while (0)
#endif

namespace rtlife {

namespace Log {

	// std::clog unless a log file has been opened.
	std::ostream& stream();
	// Appends to filename from now on; an empty name goes back to std::clog.
	// Returns false if the file cannot be opened, in which case std::clog stays in use.
	bool open_file(const std::string& filename);
}

}

#endif
