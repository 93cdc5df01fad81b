#ifndef RTLIFE_SIMULATIONCLOCK_H
#define RTLIFE_SIMULATIONCLOCK_H

#include <chrono>

namespace rtlife {

using SteadyClock = std::chrono::steady_clock;
using TimePoint = SteadyClock::time_point;

/*
 * Decides when the next automatic generation is due. Two states, Running
 * (initial) and Paused. While running, a tick is due once the interval has
 * elapsed since the last fire; firing restarts the interval.
 */
class SimulationClock
{
public:
	enum class State { Running, Paused };

private:
	std::chrono::milliseconds tick_interval_;
	TimePoint last_tick_;
	State state_;

public:
	SimulationClock(std::chrono::milliseconds tick_interval, TimePoint start);

	bool is_tick_due(TimePoint now) const;
	// Fires and restarts the interval if a tick is due.
	bool poll(TimePoint now);
	void reset(TimePoint now);

	void toggle_pause();
	State get_state() const;
	bool is_paused() const;
	std::chrono::milliseconds get_tick_interval() const;
	TimePoint get_last_tick() const;
};

// Caps the main loop at a fixed number of frames per second.
class FrameLimiter
{
private:
	SteadyClock::duration frame_period_;
	TimePoint next_frame_;

public:
	FrameLimiter(unsigned int frames_per_second, TimePoint start);

	// Time left before the next frame boundary, never more than one frame period.
	SteadyClock::duration remaining(TimePoint now) const;
	// Sleeps for remaining(now) and moves on to the following frame.
	void wait();
};

}

#endif
