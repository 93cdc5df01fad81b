#include <algorithm>
#include <csignal>
#include <stdexcept>
#include <string>
#include <ncurses.h>
#include <rtlife/CursesFrontend.hpp>

#define COLOR_PAIR_LIVE		1
#define COLOR_PAIR_GRID		2
#define COLOR_PAIR_BUTTON	3

namespace rtlife {

static volatile std::sig_atomic_t close_requested = 0;

static void request_close(int)
{
	close_requested = 1;
}

CursesFrontend::CursesFrontend(const Layout& layout):
has_colors_{false}
{
	initscr();
	cbreak();
	noecho();
	keypad(stdscr, TRUE);
	nodelay(stdscr, TRUE);
	curs_set(0);
	mousemask(BUTTON1_PRESSED | BUTTON1_CLICKED, nullptr);
	mouseinterval(0);

	if (has_colors()) {
		start_color();
		init_pair(COLOR_PAIR_LIVE, COLOR_WHITE, COLOR_BLACK);
		init_pair(COLOR_PAIR_GRID, COLOR_WHITE, COLOR_BLACK);
		init_pair(COLOR_PAIR_BUTTON, COLOR_BLACK, COLOR_GREEN);
		has_colors_ = true;
	}

	int terminal_rows, terminal_cols;
	getmaxyx(stdscr, terminal_rows, terminal_cols);
	const int needed_cols = std::max(layout.grid_width(), layout.button.x + layout.button.width);
	// one more row for the status line
	const int needed_rows = layout.button.y + layout.button.height + 1;
	if (terminal_cols < needed_cols || terminal_rows < needed_rows) {
		endwin();
		throw std::runtime_error("terminal is " + std::to_string(terminal_cols) + "x" + std::to_string(terminal_rows)
			+ ", the layout needs " + std::to_string(needed_cols) + "x" + std::to_string(needed_rows));
	}

	close_requested = 0;
	std::signal(SIGINT, request_close);
	std::signal(SIGTERM, request_close);
}

CursesFrontend::~CursesFrontend()
{
	std::signal(SIGINT, SIG_DFL);
	std::signal(SIGTERM, SIG_DFL);
	endwin();
}

std::vector<RawEvent> CursesFrontend::poll_events()
{
	std::vector<RawEvent> events;
	int ch;
	while ((ch = getch()) != ERR) {
		if (ch == KEY_MOUSE) {
			MEVENT mouse_event;
			if (getmouse(&mouse_event) == OK && (mouse_event.bstate & (BUTTON1_PRESSED | BUTTON1_CLICKED))) {
				events.push_back(RawEvent::pointer_down(mouse_event.x, mouse_event.y));
			}
		} else if (ch == KEY_ENTER || ch == '\r') {
			events.push_back(RawEvent::key_press(RTLIFE_KEY_ENTER));
		} else if (ch != KEY_RESIZE) {
			events.push_back(RawEvent::key_press(ch));
		}
	}
	if (close_requested) {
		close_requested = 0;
		events.push_back(RawEvent::window_close());
	}
	return events;
}

void CursesFrontend::render(const FrameView& view)
{
	erase();
	if (view.phase == Phase::ShowingInstructions) {
		draw_instructions(view);
	} else {
		draw_grid(view);
		draw_button(view);
		draw_status(view);
	}
	refresh();
}

void CursesFrontend::draw_grid(const FrameView& view)
{
	const auto& layout = view.layout;
	for (auto y = 0UL; y < view.grid.get_rows(); y++) {
		for (auto x = 0UL; x < view.grid.get_cols(); x++) {
			const int px = static_cast<int>(x) * layout.cell_width;
			const int py = static_cast<int>(y) * layout.cell_height;
			const bool alive = view.grid.get(x, y);
			for (int dy = 0; dy < layout.cell_height; dy++) {
				for (int dx = 0; dx < layout.cell_width; dx++) {
					if (alive) {
						mvaddch(py + dy, px + dx, ' ' | A_REVERSE | (has_colors_ ? COLOR_PAIR(COLOR_PAIR_LIVE) : 0));
					} else if (dx == 0 && dy == 0) {
						mvaddch(py, px, '.' | A_DIM | (has_colors_ ? COLOR_PAIR(COLOR_PAIR_GRID) : 0));
					}
				}
			}
		}
	}
}

void CursesFrontend::draw_button(const FrameView& view)
{
	const auto& button = view.layout.button;
	const chtype attributes = A_BOLD | (has_colors_ ? COLOR_PAIR(COLOR_PAIR_BUTTON) : A_REVERSE);
	attron(attributes);
	mvprintw(button.y, button.x, "%s", RTLIFE_BUTTON_LABEL);
	attroff(attributes);
}

void CursesFrontend::draw_status(const FrameView& view)
{
	const auto& button = view.layout.button;
	std::string line = "Generation " + std::to_string(view.generation)
		+ " | " + (view.paused ? "paused" : "running")
		+ " | " + std::to_string(view.grid.live_count()) + " alive";
	if (!view.status.empty()) {
		line += " | " + view.status;
	}
	mvaddnstr(button.y + button.height, 0, line.c_str(), COLS);
}

void CursesFrontend::draw_instructions(const FrameView& view)
{
	const int line_count = static_cast<int>(view.instructions.size());
	const int top = std::max(0, (LINES - line_count) / 2);
	for (int i = 0; i < line_count; i++) {
		const auto& line = view.instructions[i];
		const int left = std::max(0, (COLS - static_cast<int>(line.size())) / 2);
		mvaddnstr(top + i, left, line.c_str(), COLS - left);
	}
}

}
