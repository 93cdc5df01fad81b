#ifndef RTLIFE_INPUTTRANSLATOR_H
#define RTLIFE_INPUTTRANSLATOR_H

#include <optional>
#include <ostream>

#define RTLIFE_KEY_ENTER	'\n'
#define RTLIFE_BUTTON_LABEL	"[ Next Generation ]"

namespace rtlife {

struct RawEvent
{
	enum class Type { PointerDown, KeyPress, WindowClose };

	Type type;
	int x;		// pixel column, PointerDown only
	int y;		// pixel row, PointerDown only
	int key;	// KeyPress only

	static RawEvent pointer_down(int x, int y);
	static RawEvent key_press(int key);
	static RawEvent window_close();
};

struct Command
{
	enum class Type { ToggleCell, AdvanceGeneration, TogglePause, SaveState, LoadState, ExportSnapshot, Proceed, Quit };

	Type type;
	unsigned long x;	// ToggleCell only
	unsigned long y;

	static Command of(Type type);
	static Command toggle_cell(unsigned long x, unsigned long y);
	bool operator==(const Command& other) const;
	friend std::ostream& operator<<(std::ostream& os, const Command& command);
};

struct KeyBindings
{
	int pause = ' ';
	int save = 's';
	int load = 'l';
	int quit = 'q';
	int proceed = RTLIFE_KEY_ENTER;
	int export_snapshot = 'p';
};

struct Rect
{
	int x, y, width, height;

	bool contains(int px, int py) const;
};

/*
 * Pixel geometry shared by the translator and the renderer. The grid starts
 * at pixel (0, 0); each cell covers cell_width x cell_height pixels.
 */
struct Layout
{
	unsigned long cols, rows;
	int cell_width, cell_height;
	Rect button;

	// Cells take width / cols by height / rows pixels. The button is centered
	// on the row just below the grid.
	static Layout compute(int width, int height, unsigned long cols, unsigned long rows, int button_width, int button_height);
	int grid_width() const;
	int grid_height() const;
	bool in_grid(int px, int py) const;
};

class InputTranslator
{
private:
	Layout layout_;
	KeyBindings keys_;

public:
	InputTranslator(const Layout& layout, const KeyBindings& keys);
	// Empty for clicks outside the grid and the button, and for unbound keys.
	std::optional<Command> translate(const RawEvent& event) const;
	const Layout& get_layout() const;
};

}

#endif
