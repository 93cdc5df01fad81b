#ifndef RTLIFE_CURSESFRONTEND_H
#define RTLIFE_CURSESFRONTEND_H

#include <rtlife/Frontend.hpp>

namespace rtlife {

/*
 * Terminal frontend. Each character cell is one pixel, left clicks are
 * pointer-down events and SIGINT/SIGTERM close the window. The terminal is
 * taken over for the lifetime of the object.
 */
class CursesFrontend : public Frontend
{
private:
	bool has_colors_;

	void draw_grid(const FrameView& view);
	void draw_button(const FrameView& view);
	void draw_status(const FrameView& view);
	void draw_instructions(const FrameView& view);

public:
	// Throws std::runtime_error if the terminal cannot hold the layout.
	explicit CursesFrontend(const Layout& layout);
	~CursesFrontend() override;
	CursesFrontend(const CursesFrontend&) = delete;
	CursesFrontend& operator=(const CursesFrontend&) = delete;

	std::vector<RawEvent> poll_events() override;
	void render(const FrameView& view) override;
};

}

#endif
