#include <thread>
#include <rtlife/SimulationClock.hpp>

namespace rtlife {

SimulationClock::SimulationClock(std::chrono::milliseconds tick_interval, TimePoint start):
tick_interval_{tick_interval},
last_tick_{start},
state_{State::Running}
{}

bool SimulationClock::is_tick_due(TimePoint now) const
{
	return state_ == State::Running && now - last_tick_ >= tick_interval_;
}

bool SimulationClock::poll(TimePoint now)
{
	if (!is_tick_due(now)) {
		return false;
	}
	last_tick_ = now;
	return true;
}

void SimulationClock::reset(TimePoint now)
{
	last_tick_ = now;
}

void SimulationClock::toggle_pause()
{
	state_ = (state_ == State::Running) ? State::Paused : State::Running;
}

SimulationClock::State SimulationClock::get_state() const
{
	return state_;
}

bool SimulationClock::is_paused() const
{
	return state_ == State::Paused;
}

std::chrono::milliseconds SimulationClock::get_tick_interval() const
{
	return tick_interval_;
}

TimePoint SimulationClock::get_last_tick() const
{
	return last_tick_;
}

FrameLimiter::FrameLimiter(unsigned int frames_per_second, TimePoint start):
frame_period_{std::chrono::duration_cast<SteadyClock::duration>(std::chrono::seconds{1}) / frames_per_second},
next_frame_{start + frame_period_}
{}

SteadyClock::duration FrameLimiter::remaining(TimePoint now) const
{
	if (now >= next_frame_) {
		return SteadyClock::duration::zero();
	}
	const auto left = next_frame_ - now;
	return left < frame_period_ ? left : frame_period_;
}

void FrameLimiter::wait()
{
	const auto now = SteadyClock::now();
	const auto left = remaining(now);
	if (left > SteadyClock::duration::zero()) {
		std::this_thread::sleep_for(left);
	}
	// A frame that overran starts the next one from now instead of trying to catch up.
	next_frame_ = (now >= next_frame_ ? now : next_frame_) + frame_period_;
}

}
