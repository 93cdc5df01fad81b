#include <cassert>
#include <deque>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <string>
#include <vector>
#include <rtlife/Errors.hpp>
#include <rtlife/GenerationEngine.hpp>
#include <rtlife/PersistenceAdapter.hpp>
#include <rtlife/SimulationController.hpp>
#include "TestUtils.hpp"

namespace fs = std::filesystem;
using namespace rtlife;
using std::chrono::milliseconds;

static const fs::path workdir = fs::temp_directory_path() / "rtlife_test_controller";

// Hands out one scripted batch of events per frame and records what was drawn.
class ScriptedFrontend : public Frontend
{
public:
    struct Drawn {
        Phase phase;
        bool paused;
        unsigned long generation;
        unsigned long live_count;
        std::string status;
    };

    std::deque<std::vector<RawEvent>> script;
    std::vector<Drawn> frames;

    std::vector<RawEvent> poll_events() override {
        if (script.empty()) {
            return {};
        }
        auto events = script.front();
        script.pop_front();
        return events;
    }

    void render(const FrameView& view) override {
        assert(!view.instructions.empty());
        frames.push_back({view.phase, view.paused, view.generation, view.grid.live_count(), view.status});
    }
};

static Config test_config(const std::string& name) {
    Config config;
    config.width = 20;
    config.height = 10;
    config.cols = 10;
    config.rows = 10;
    config.tick_interval = 0.8;
    config.frame_rate = 1000;
    config.state_file = (workdir / name).string();
    config.snapshot_dir = (workdir / "pics").string();
    return config;
}

static const RawEvent ENTER = RawEvent::key_press(RTLIFE_KEY_ENTER);

// ..........
// ..o.......
// ..o.......
// ..o.......
static GridState blinker() {
    return grid_from(10, 10, {{2, 1}, {2, 2}, {2, 3}});
}

void test_instructions_gate() {
    ScriptedFrontend frontend;
    const TimePoint start{};
    SimulationController controller{test_config("gate"), frontend, blinker(), start};
    assert(controller.get_phase() == Phase::ShowingInstructions);

    controller.handle_events({RawEvent::pointer_down(0, 0), RawEvent::pointer_down(10, 11),
                              RawEvent::key_press(' '), RawEvent::key_press('s')}, start);
    assert(controller.get_grid() == blinker());
    assert(!controller.get_clock().is_paused());
    assert(!fs::exists(controller.state_path()));

    // no automatic generations while the instructions are up
    assert(!controller.update(start + milliseconds{5000}));
    assert(controller.get_generation() == 0);

    controller.handle_events({ENTER, RawEvent::pointer_down(0, 0)}, start + milliseconds{5000});
    assert(controller.get_phase() == Phase::Simulating);
    assert(controller.get_grid().get(0, 0));
    // the tick interval starts when the instructions are dismissed
    assert(!controller.update(start + milliseconds{5700}));
    assert(controller.update(start + milliseconds{5800}));
    std::cout << "PASSED: test_instructions_gate\n";
}

void test_quit_from_instructions() {
    ScriptedFrontend frontend;
    SimulationController controller{test_config("quit"), frontend, blinker(), TimePoint{}};
    controller.handle_events({RawEvent::window_close()}, TimePoint{});
    assert(!controller.is_running());
    assert(controller.get_phase() == Phase::ShowingInstructions);
    std::cout << "PASSED: test_quit_from_instructions\n";
}

void test_events_applied_in_order() {
    ScriptedFrontend frontend;
    const TimePoint start{};
    SimulationController controller{test_config("order"), frontend, blinker(), start};
    controller.handle_events({ENTER}, start);

    // toggled twice within one frame: unchanged
    controller.handle_events({RawEvent::pointer_down(8, 5), RawEvent::pointer_down(9, 5)}, start);
    assert(controller.get_grid() == blinker());

    // toggle (1,2) then advance: the advance sees the toggled cell
    controller.handle_events({RawEvent::pointer_down(2, 2), RawEvent::pointer_down(1, 11)}, start);
    GridState expected = blinker();
    expected.toggle(1, 2);
    expected = GenerationEngine::compute_next(expected);
    assert(controller.get_grid() == expected);
    assert(controller.get_generation() == 1);
    std::cout << "PASSED: test_events_applied_in_order\n";
}

void test_automatic_ticks_and_pause() {
    ScriptedFrontend frontend;
    const TimePoint start{};
    SimulationController controller{test_config("ticks"), frontend, blinker(), start};
    controller.handle_events({ENTER}, start);

    assert(!controller.update(start + milliseconds{799}));
    assert(controller.update(start + milliseconds{800}));
    assert(controller.get_grid() == GenerationEngine::compute_next(blinker()));

    controller.handle_events({RawEvent::key_press(' ')}, start + milliseconds{900});
    assert(controller.get_clock().is_paused());
    assert(controller.get_status() == "Paused");
    assert(!controller.update(start + milliseconds{10000}));
    assert(controller.get_generation() == 1);

    // manual advance still works while paused
    controller.handle_events({RawEvent::pointer_down(1, 11)}, start + milliseconds{10000});
    assert(controller.get_generation() == 2);
    assert(controller.get_grid() == blinker());

    controller.handle_events({RawEvent::key_press(' ')}, start + milliseconds{10000});
    assert(!controller.get_clock().is_paused());
    assert(controller.update(start + milliseconds{10000}));
    assert(controller.get_generation() == 3);
    std::cout << "PASSED: test_automatic_ticks_and_pause\n";
}

void test_manual_advance_keeps_timer() {
    ScriptedFrontend frontend;
    const TimePoint start{};
    SimulationController controller{test_config("manual"), frontend, blinker(), start};
    controller.handle_events({ENTER}, start);

    controller.handle_events({RawEvent::pointer_down(1, 11)}, start + milliseconds{500});
    assert(controller.get_generation() == 1);
    assert(controller.get_clock().get_last_tick() == start);
    assert(controller.update(start + milliseconds{800}));
    assert(controller.get_generation() == 2);
    std::cout << "PASSED: test_manual_advance_keeps_timer\n";
}

void test_save_and_load() {
    ScriptedFrontend frontend;
    const TimePoint start{};
    SimulationController controller{test_config("roundtrip"), frontend, blinker(), start};
    controller.handle_events({ENTER, RawEvent::key_press('s')}, start);
    assert(fs::exists(controller.state_path()));
    assert(controller.get_status() == "Saved to " + controller.state_path());

    controller.handle_events({RawEvent::pointer_down(1, 11), RawEvent::pointer_down(10, 8)}, start);
    assert(controller.get_grid() != blinker());

    controller.handle_events({RawEvent::key_press('l')}, start);
    assert(controller.get_grid() == blinker());
    assert(controller.get_status() == "Loaded " + controller.state_path());
    std::cout << "PASSED: test_save_and_load\n";
}

void test_load_without_save() {
    ScriptedFrontend frontend;
    SimulationController controller{test_config("never_saved"), frontend, blinker(), TimePoint{}};
    controller.handle_events({ENTER, RawEvent::key_press('l')}, TimePoint{});
    assert(controller.is_running());
    assert(controller.get_grid() == blinker());
    assert(controller.get_status().rfind("Nothing to load", 0) == 0);
    std::cout << "PASSED: test_load_without_save\n";
}

void test_rejected_loads_leave_grid_unchanged() {
    ScriptedFrontend frontend;
    const Config config = test_config("rejected");
    SimulationController controller{config, frontend, blinker(), TimePoint{}};
    controller.handle_events({ENTER}, TimePoint{});

    // a valid file holding a grid of other dimensions
    PersistenceAdapter::save(grid_from(5, 5, {{1, 1}}), controller.state_path());
    controller.handle_events({RawEvent::key_press('l')}, TimePoint{});
    assert(controller.get_grid() == blinker());
    assert(controller.get_status().rfind("Load failed", 0) == 0);

    {
        std::ofstream outstream(controller.state_path(), std::ios_base::binary | std::ios_base::trunc);
        outstream << "RTLIFE1 10 10\n" << "truncated";
    }
    controller.handle_events({RawEvent::key_press('l')}, TimePoint{});
    assert(controller.get_grid() == blinker());
    assert(controller.get_status().rfind("Load failed", 0) == 0);
    std::cout << "PASSED: test_rejected_loads_leave_grid_unchanged\n";
}

void test_export_snapshot() {
    ScriptedFrontend frontend;
    const Config config = test_config("export");
    SimulationController controller{config, frontend, blinker(), TimePoint{}};
    controller.handle_events({ENTER, RawEvent::pointer_down(1, 11), RawEvent::key_press('p')}, TimePoint{});
    const auto path = PersistenceAdapter::snapshot_filename(config.snapshot_dir, 1);
    assert(fs::exists(path));
    assert(fs::file_size(path) == std::string("P5 10 10 255\n").size() + 100);
    assert(controller.get_status() == "Exported " + path);
    std::cout << "PASSED: test_export_snapshot\n";
}

void test_run_until_quit() {
    ScriptedFrontend frontend;
    frontend.script.push_back({RawEvent::pointer_down(0, 0)});
    frontend.script.push_back({ENTER});
    frontend.script.push_back({RawEvent::pointer_down(0, 0)});
    frontend.script.push_back({RawEvent::key_press(' '), RawEvent::key_press('q'), RawEvent::pointer_down(4, 4)});
    frontend.script.push_back({RawEvent::pointer_down(6, 6)});

    SimulationController controller{test_config("run"), frontend, blinker(), SteadyClock::now()};
    controller.run();

    assert(!controller.is_running());
    // the quitting frame still finishes its events and render
    assert(frontend.frames.size() == 4);
    assert(frontend.script.size() == 1);
    assert(frontend.frames[0].phase == Phase::ShowingInstructions);
    assert(frontend.frames[0].live_count == 3);
    assert(frontend.frames[1].phase == Phase::Simulating);
    assert(frontend.frames[2].live_count == 4);
    assert(frontend.frames[3].paused);
    assert(controller.get_grid().get(0, 0));
    assert(controller.get_grid().get(2, 4));
    std::cout << "PASSED: test_run_until_quit\n";
}

void test_invalid_setup_rejected() {
    ScriptedFrontend frontend;
    bool thrown = false;
    try {
        SimulationController controller{test_config("mismatch"), frontend, GridState{4, 4}, TimePoint{}};
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);

    Config config = test_config("invalid");
    config.cols = 0;
    thrown = false;
    try {
        SimulationController controller{config, frontend, blinker(), TimePoint{}};
    } catch (const ConfigurationError&) {
        thrown = true;
    }
    assert(thrown);
    std::cout << "PASSED: test_invalid_setup_rejected\n";
}

int main() {
    fs::remove_all(workdir);
    fs::create_directories(workdir);

    test_instructions_gate();
    test_quit_from_instructions();
    test_events_applied_in_order();
    test_automatic_ticks_and_pause();
    test_manual_advance_keeps_timer();
    test_save_and_load();
    test_load_without_save();
    test_rejected_loads_leave_grid_unchanged();
    test_export_snapshot();
    test_run_until_quit();
    test_invalid_setup_rejected();

    fs::remove_all(workdir);
    std::cout << "\nAll simulation controller tests passed!\n";
    return 0;
}
