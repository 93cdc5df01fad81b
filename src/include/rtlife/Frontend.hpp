#ifndef RTLIFE_FRONTEND_H
#define RTLIFE_FRONTEND_H

#include <string>
#include <vector>
#include <rtlife/GridState.hpp>
#include <rtlife/InputTranslator.hpp>

namespace rtlife {

enum class Phase { ShowingInstructions, Simulating };

// Everything a renderer needs to draw one frame.
struct FrameView
{
	const GridState& grid;
	const Layout& layout;
	Phase phase;
	bool paused;
	unsigned long generation;
	const std::string& status;
	const std::vector<std::string>& instructions;
};

// Window, drawing and raw input. The simulation core only talks to this interface.
class Frontend
{
public:
	virtual ~Frontend() = default;
	// Raw events queued since the previous call, oldest first.
	virtual std::vector<RawEvent> poll_events() = 0;
	virtual void render(const FrameView& view) = 0;
};

}

#endif
