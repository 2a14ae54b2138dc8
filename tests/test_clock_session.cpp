#include "fake_display.hpp"
#include "temp_dir.hpp"
#include "topclock/core/session.hpp"
#include <catch2/catch_test_macros.hpp>

using namespace topclock;
using namespace std::chrono_literals;
using topclock::test::FakeDisplay;
using topclock::test::TempDir;

namespace {

using Clock = ClockSession::Clock;

Clock::time_point t0()
{
    return Clock::time_point{} + 100s;
}

PointerEvent pointer(PointerEvent::Kind kind, Point screen, Point window_origin)
{
    return { kind, PRIMARY_BUTTON, { screen.x - window_origin.x, screen.y - window_origin.y }, screen };
}

} // namespace

TEST_CASE("First run centres and persists within the save delay", "[session][integration]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});

    session.start(initial_geometry(store.load()), t0());

    REQUIRE(display.position() == Point{ 810, 490 });
    REQUIRE_FALSE(session.geometry().geometry().needs_centering);
    REQUIRE(display.always_on_top());
    REQUIRE(display.resizable());

    session.step(t0() + 16ms);
    REQUIRE_FALSE(std::filesystem::exists(store.path()));

    session.step(t0() + 1000ms);
    auto saved = store.load();
    REQUIRE(saved.status == GeometryStore::LoadStatus::Loaded);

    PersistedGeometry expected;
    expected.width = 300;
    expected.height = 100;
    expected.monitor = 0;
    expected.position = { 810, 490 };
    expected.border = true;
    REQUIRE(saved.geometry == expected);
}

TEST_CASE("Existing record is applied without scheduling a save", "[session]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    PersistedGeometry record;
    record.position = { 30, 40 };
    REQUIRE(store.save(record));

    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    REQUIRE(display.position() == Point{ 30, 40 });
    REQUIRE_FALSE(session.scheduler().pending());

    session.step(t0() + 5s);
    REQUIRE_FALSE(session.scheduler().pending());
}

TEST_CASE("Click toggles the border and the compensated size is saved", "[session][integration]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());
    session.step(t0() + 1s);

    Point origin = display.position();
    auto t1 = t0() + 10s;
    session.handle_pointer(pointer(PointerEvent::Kind::Press, { 900, 520 }, origin), t1);
    session.handle_pointer(pointer(PointerEvent::Kind::Release, { 900, 520 }, origin), t1);
    session.step(t1);

    REQUIRE_FALSE(display.decorated());
    REQUIRE(session.geometry().persisted().height == 135);
    REQUIRE(session.scheduler().pending());

    session.step(t1 + 1s);
    auto saved = store.load().geometry;
    REQUIRE_FALSE(saved.border);
    REQUIRE(saved.height == 135);
    REQUIRE(saved.position == Point{ 810, 490 });
}

TEST_CASE("Drag moves the borderless window and saves once after release", "[session][integration]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    PersistedGeometry record;
    record.position = { 100, 100 };
    record.border = false;
    REQUIRE(store.save(record));

    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    Point origin = display.position();
    auto t = t0();
    session.handle_pointer(pointer(PointerEvent::Kind::Press, { 150, 130 }, origin), t);
    for (int i = 1; i <= 10; ++i)
    {
        t += 16ms;
        session.handle_pointer(pointer(PointerEvent::Kind::Move, { 150 + i * 10, 130 + i * 5 }, origin), t);
        session.step(t);
    }
    REQUIRE(display.position() == Point{ 200, 150 });
    REQUIRE_FALSE(session.scheduler().pending());

    session.handle_pointer(pointer(PointerEvent::Kind::Release, { 250, 180 }, origin), t);
    session.step(t);
    REQUIRE(session.scheduler().pending());
    REQUIRE(store.load().geometry.position == Point{ 100, 100 });

    session.step(t + 1s);
    REQUIRE(store.load().geometry.position == Point{ 200, 150 });
    REQUIRE_FALSE(display.decorated());
}

TEST_CASE("External resizes are saved after they settle", "[session]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());
    session.step(t0() + 1s);

    auto t = t0() + 5s;
    for (int i = 1; i <= 5; ++i)
    {
        display.external_resize({ 300 + i * 20, 100 + i * 10 });
        session.step(t);
        t += 100ms;
    }
    REQUIRE(store.load().geometry.width == 300);

    session.step(t + 1s);
    auto saved = store.load().geometry;
    REQUIRE(saved.width == 400);
    REQUIRE(saved.height == 150);
}

TEST_CASE("Keyboard toggle goes through the same compensation", "[session]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    session.toggle_border(t0());
    session.toggle_border(t0());

    REQUIRE(display.decorated());
    REQUIRE(display.content_size() == Size{ 300, 100 });
}

TEST_CASE("Shutdown flushes a pending save", "[session]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    session.shutdown();

    REQUIRE(store.load().status == GeometryStore::LoadStatus::Loaded);
    REQUIRE_FALSE(session.scheduler().pending());
}

TEST_CASE("Shutdown writes a drag released just before exit without the display", "[session]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");
    PersistedGeometry record;
    record.position = { 100, 100 };
    record.border = false;
    REQUIRE(store.save(record));

    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    Point origin = display.position();
    session.handle_pointer(pointer(PointerEvent::Kind::Press, { 150, 130 }, origin), t0());
    session.handle_pointer(pointer(PointerEvent::Kind::Move, { 250, 180 }, origin), t0() + 16ms);
    session.handle_pointer(pointer(PointerEvent::Kind::Release, { 250, 180 }, origin), t0() + 32ms);
    REQUIRE(session.scheduler().pending());

    // The loop can end on a lost connection, with no further frame
    display.calls.clear();
    session.shutdown();

    REQUIRE(display.calls.empty());
    REQUIRE(store.load().geometry.position == Point{ 200, 150 });
}

TEST_CASE("Borderless record survives a restart", "[session][integration]")
{
    TempDir dir;
    GeometryStore store(dir / "clock.json");

    {
        FakeDisplay display;
        ClockSession session(display, store, SessionSettings{});
        session.start(initial_geometry(store.load()), t0());
        session.toggle_border(t0());
        session.step(t0());
        session.shutdown();
    }

    FakeDisplay display;
    ClockSession session(display, store, SessionSettings{});
    session.start(initial_geometry(store.load()), t0());

    REQUIRE_FALSE(display.decorated());
    REQUIRE(display.content_size() == Size{ 300, 135 });
    REQUIRE(display.position() == Point{ 810, 490 });

    session.step(t0() + 16ms);
    REQUIRE_FALSE(session.scheduler().pending());
}
