#include "topclock/config/geometry_store.hpp"
#include "x11_test_harness.hpp"
#include <catch2/catch_test_macros.hpp>
#include <chrono>

using namespace topclock;
using namespace topclock::test;

namespace {

constexpr auto kTimeout = std::chrono::seconds(3);

bool ensure_x11_environment()
{
    auto& env = X11TestEnvironment::instance();
    if (!env.available())
    {
        WARN("Xvfb not available; set TOPCLOCK_TEST_ALLOW_EXISTING_DISPLAY=1 to use an existing DISPLAY.");
        return false;
    }
    return true;
}

std::optional<xcb_window_t> wait_for_clock_window(X11Connection& conn)
{
    std::optional<xcb_window_t> window;
    wait_for_condition(
        [&]()
        {
            window = find_window_by_name(conn, "clock");
            return window.has_value();
        },
        kTimeout
    );
    return window;
}

} // namespace

TEST_CASE("First launch writes the centred geometry", "[integration]")
{
    if (!ensure_x11_environment())
        return;

    X11Connection conn;
    REQUIRE(conn.ok());

    ClockProcess clock(X11TestEnvironment::instance().display());
    if (!clock.running())
    {
        WARN("topclock executable not available.");
        return;
    }

    REQUIRE(wait_for_clock_window(conn).has_value());
    REQUIRE(wait_for_condition([&]() { return std::filesystem::exists(clock.geometry_file()); }, kTimeout));

    // The file may be caught mid-write; wait for a complete record
    GeometryStore store(clock.geometry_file());
    REQUIRE(wait_for_condition(
        [&]() { return store.load().status == GeometryStore::LoadStatus::Loaded; },
        kTimeout
    ));

    auto geometry = store.load().geometry;
    REQUIRE(geometry.width == 300);
    REQUIRE(geometry.height == 100);
    REQUIRE(geometry.monitor == 0);
    REQUIRE(geometry.position == Point{ 490, 310 });
    REQUIRE(geometry.border);
}

TEST_CASE("Close request ends the clock cleanly", "[integration]")
{
    if (!ensure_x11_environment())
        return;

    X11Connection conn;
    REQUIRE(conn.ok());

    ClockProcess clock(X11TestEnvironment::instance().display());
    if (!clock.running())
    {
        WARN("topclock executable not available.");
        return;
    }

    auto window = wait_for_clock_window(conn);
    REQUIRE(window.has_value());

    send_delete_window(conn, *window);

    auto code = clock.wait_exit(kTimeout);
    REQUIRE(code.has_value());
    REQUIRE(*code == 0);

    // Shutdown flushes the first-run placement even before the save delay
    REQUIRE(std::filesystem::exists(clock.geometry_file()));
}

TEST_CASE("SIGTERM ends the clock cleanly", "[integration]")
{
    if (!ensure_x11_environment())
        return;

    X11Connection conn;
    REQUIRE(conn.ok());

    ClockProcess clock(X11TestEnvironment::instance().display());
    if (!clock.running())
    {
        WARN("topclock executable not available.");
        return;
    }

    REQUIRE(wait_for_clock_window(conn).has_value());
    // First save happens inside the frame loop, so the handlers are installed by then
    REQUIRE(wait_for_condition([&]() { return std::filesystem::exists(clock.geometry_file()); }, kTimeout));

    auto code = clock.stop();
    REQUIRE(code.has_value());
    REQUIRE(*code == 0);
}

TEST_CASE("Losing the X server still writes the pending geometry", "[integration]")
{
    // A server of its own, so the shared one survives
    auto server = XvfbServer::start(121, 140);
    if (!server)
    {
        WARN("Could not start a private Xvfb.");
        return;
    }

    X11Connection conn(server->display().c_str());
    REQUIRE(conn.ok());

    // Long enough that only the exit path can write the file
    ClockProcess clock(server->display(), "[interaction]\nsave_delay_ms = 60000\n");
    if (!clock.running())
    {
        WARN("topclock executable not available.");
        return;
    }

    REQUIRE(wait_for_clock_window(conn).has_value());
    REQUIRE_FALSE(std::filesystem::exists(clock.geometry_file()));

    server->stop();

    auto code = clock.wait_exit(kTimeout);
    REQUIRE(code.has_value());

    GeometryStore store(clock.geometry_file());
    auto saved = store.load();
    REQUIRE(saved.status == GeometryStore::LoadStatus::Loaded);
    REQUIRE(saved.geometry.position == Point{ 490, 310 });
}
