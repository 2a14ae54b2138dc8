#include "app.hpp"
#include "topclock/clock/time_format.hpp"
#include "topclock/core/log.hpp"
#include <algorithm>
#include <cerrno>
#include <csignal>
#include <cstdlib>
#include <cstring>
#include <ctime>
#include <memory>
#include <poll.h>

namespace topclock {

namespace {

volatile std::sig_atomic_t g_stop_requested = 0;

void stop_handler(int /*sig*/)
{
    g_stop_requested = 1;
}

void setup_signal_handlers()
{
    // No SA_RESTART: poll() must return so the loop sees the flag
    struct sigaction sa = {};
    sa.sa_handler = stop_handler;
    sigemptyset(&sa.sa_mask);
    sigaction(SIGINT, &sa, nullptr);
    sigaction(SIGTERM, &sa, nullptr);

    // A vanished X server must surface as a connection error, not kill us
    // before the pending geometry is written
    struct sigaction ignore = {};
    ignore.sa_handler = SIG_IGN;
    sigemptyset(&ignore.sa_mask);
    sigaction(SIGPIPE, &ignore, nullptr);
}

SessionSettings session_settings(Config const& config)
{
    SessionSettings settings;
    settings.chrome_height = config.window.chrome_height;
    settings.flags.always_on_top = config.window.always_on_top;
    settings.flags.resizable = config.window.resizable;
    settings.drag.threshold = config.interaction.drag_threshold;
    settings.drag.requires_borderless = config.interaction.drag_requires_borderless;
    settings.save_delay = std::chrono::milliseconds(config.interaction.save_delay_ms);
    return settings;
}

XcbDisplaySettings display_settings(Config const& config, WindowGeometry const& initial)
{
    XcbDisplaySettings settings;
    settings.title = config.window.title;
    settings.initial_size = initial.persisted.size();
    settings.chrome_height = config.window.chrome_height;
    settings.background = config.appearance.background;
    return settings;
}

} // namespace

ClockApp::ClockApp(Config config, std::filesystem::path geometry_file)
    : config_(std::move(config))
    , store_(std::move(geometry_file))
    , initial_(initial_geometry(store_.load()))
    , conn_()
    , ewmh_(conn_)
    , display_(conn_, ewmh_, display_settings(config_, initial_))
    , renderer_(conn_, config_.appearance)
    , keybinds_(config_)
    , session_(display_, store_, session_settings(config_))
{
    setup_signal_handlers();

    // Flags, decorations and placement go in before mapping so the window
    // manager sees the final state on first map
    session_.start(initial_, SaveScheduler::Clock::now());
    display_.map();

    LOG_INFO("Geometry file: {}", store_.path().string());
}

void ClockApp::run()
{
    pollfd pfd = {};
    pfd.fd = conn_.file_descriptor();
    pfd.events = POLLIN;

    auto const frame = std::chrono::milliseconds(1000 / std::max<uint32_t>(1, config_.window.fps));
    auto next_frame = SaveScheduler::Clock::now();

    while (running_ && !g_stop_requested)
    {
        auto now = SaveScheduler::Clock::now();
        int timeout_ms = 0;
        if (next_frame > now)
        {
            auto delta = std::chrono::duration_cast<std::chrono::milliseconds>(next_frame - now);
            timeout_ms = static_cast<int>(delta.count());
        }

        if (poll(&pfd, 1, timeout_ms) < 0 && errno != EINTR)
        {
            LOG_ERROR("poll failed: {}", std::strerror(errno));
            break;
        }

        // Replies can pull events into XCB's queue without the fd becoming readable
        while (auto event = xcb_poll_for_event(conn_.get()))
        {
            std::unique_ptr<xcb_generic_event_t, decltype(&free)> eventPtr(event, free);
            handle_event(*eventPtr);
        }

        if (conn_.has_error())
        {
            LOG_ERROR("Lost connection to the X server");
            break;
        }

        now = SaveScheduler::Clock::now();
        if (now >= next_frame)
        {
            session_.step(now);
            draw();
            next_frame = now + frame;
        }
    }

    if (g_stop_requested)
        LOG_INFO("Stop requested by signal");

    // The store only needs the cached record, so this runs with or without a display
    session_.shutdown();
}

void ClockApp::draw()
{
    renderer_.draw(display_.window(), display_.content_size(), clock::local_clock_time(std::time(nullptr)));
}

} // namespace topclock
