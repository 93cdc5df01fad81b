#include <rtlife/InputTranslator.hpp>

namespace rtlife {

RawEvent RawEvent::pointer_down(int x, int y)
{
	return RawEvent{Type::PointerDown, x, y, 0};
}

RawEvent RawEvent::key_press(int key)
{
	return RawEvent{Type::KeyPress, 0, 0, key};
}

RawEvent RawEvent::window_close()
{
	return RawEvent{Type::WindowClose, 0, 0, 0};
}

Command Command::of(Type type)
{
	return Command{type, 0, 0};
}

Command Command::toggle_cell(unsigned long x, unsigned long y)
{
	return Command{Type::ToggleCell, x, y};
}

bool Command::operator==(const Command& other) const
{
	return type == other.type && x == other.x && y == other.y;
}

std::ostream& operator<<(std::ostream& os, const Command& command)
{
	switch (command.type) {
	case Command::Type::ToggleCell:
		return os << "toggle cell (" << command.x << ", " << command.y << ")";
	case Command::Type::AdvanceGeneration:
		return os << "advance generation";
	case Command::Type::TogglePause:
		return os << "toggle pause";
	case Command::Type::SaveState:
		return os << "save state";
	case Command::Type::LoadState:
		return os << "load state";
	case Command::Type::ExportSnapshot:
		return os << "export snapshot";
	case Command::Type::Proceed:
		return os << "proceed";
	case Command::Type::Quit:
		return os << "quit";
	}
	return os;
}

bool Rect::contains(int px, int py) const
{
	return px >= x && px < x + width && py >= y && py < y + height;
}

Layout Layout::compute(int width, int height, unsigned long cols, unsigned long rows, int button_width, int button_height)
{
	Layout layout{};
	layout.cols = cols;
	layout.rows = rows;
	layout.cell_width = width / static_cast<int>(cols);
	layout.cell_height = height / static_cast<int>(rows);
	layout.button = Rect{(layout.grid_width() - button_width) / 2, layout.grid_height() + 1, button_width, button_height};
	if (layout.button.x < 0) {
		layout.button.x = 0;
	}
	return layout;
}

int Layout::grid_width() const
{
	return cell_width * static_cast<int>(cols);
}

int Layout::grid_height() const
{
	return cell_height * static_cast<int>(rows);
}

bool Layout::in_grid(int px, int py) const
{
	return px >= 0 && py >= 0 && px < grid_width() && py < grid_height();
}

InputTranslator::InputTranslator(const Layout& layout, const KeyBindings& keys):
layout_{layout},
keys_{keys}
{}

std::optional<Command> InputTranslator::translate(const RawEvent& event) const
{
	switch (event.type) {
	case RawEvent::Type::WindowClose:
		return Command::of(Command::Type::Quit);
	case RawEvent::Type::PointerDown:
		if (layout_.button.contains(event.x, event.y)) {
			return Command::of(Command::Type::AdvanceGeneration);
		}
		if (layout_.in_grid(event.x, event.y)) {
			return Command::toggle_cell(static_cast<unsigned long>(event.x / layout_.cell_width),
										static_cast<unsigned long>(event.y / layout_.cell_height));
		}
		return std::nullopt;
	case RawEvent::Type::KeyPress:
		if (event.key == keys_.pause) {
			return Command::of(Command::Type::TogglePause);
		} else if (event.key == keys_.save) {
			return Command::of(Command::Type::SaveState);
		} else if (event.key == keys_.load) {
			return Command::of(Command::Type::LoadState);
		} else if (event.key == keys_.quit) {
			return Command::of(Command::Type::Quit);
		} else if (event.key == keys_.proceed) {
			return Command::of(Command::Type::Proceed);
		} else if (event.key == keys_.export_snapshot) {
			return Command::of(Command::Type::ExportSnapshot);
		}
		return std::nullopt;
	}
	return std::nullopt;
}

const Layout& InputTranslator::get_layout() const
{
	return layout_;
}

}
