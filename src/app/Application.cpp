#include "app/Application.h"
#include "app/TextSummary.h"
#include "data/DatabaseException.h"
#include "display/FrameComposer.h"
#include "display/Transition.h"
#include "logging/Logger.h"
#include "utils/FrameClock.h"
#include "utils/KeyboardInput.h"

#include <cstdio>

Application::Application(Config::AppConfig config, ArgumentParser::AppArgs args)
    : config_{std::move(config)}, args_{std::move(args)} {
}

Application::~Application() {
    shutdown();
}

int Application::run() {
    Logger::separator('=');
    Logger::info(Logger::Source::Other, tag_, "Disney Wait Times Display starting...");
    Logger::separator('=');

    SignalHelper::setup(signals_);

    curl_ = std::make_unique<CurlGlobal>();
    apiTransport_ = std::make_unique<CurlTransport>(config_.api.timeout);
    client_ = std::make_unique<QueueTimesClient>(*apiTransport_, config_.api);

    Logger::info(Logger::Source::Fetcher, tag_, "Fetching wait times from queue-times.com...");
    const FetchResult initial = client_->fetchAll();
    if (!initial.fetchSuccess || !initial.snapshot) {
        Logger::error(Logger::Source::Fetcher, tag_, "Failed to fetch initial wait times");
        if (!args_.textOnly) {
            std::fprintf(stderr, "Error: Could not fetch wait times. Check network connection.\n");
        }
        return 1;
    }
    Logger::info(Logger::Source::Fetcher, tag_, "Fetched %zu open rides", initial.snapshot->allOpenRides().size());

    if (args_.textOnly) {
        const std::string summary = formatTextSummary(*initial.snapshot);
        std::fputs(summary.c_str(), stdout);
        return 0;
    }

    try {
        setup(initial.snapshot);
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Display, tag_, "Failed to initialize display: %s", e.what());
        return 1;
    }

    int rc = 0;
    try {
        mainLoop();
    } catch (const std::exception &e) {
        Logger::error(Logger::Source::Other, tag_, "Unexpected error: %s", e.what());
        rc = 1;
    }
    shutdown();
    Logger::info(Logger::Source::Other, tag_, "Application shutdown complete");
    return rc;
}

void Application::setup(std::shared_ptr<const WaitTimesData> initial) {
    display_ = std::make_unique<FramebufferDisplay>(config_.display.device);
    if (args_.fullscreen || config_.display.fullscreen) {
        width_ = display_->width();
        height_ = display_->height();
    } else {
        width_ = static_cast<int>(config_.display.width);
        height_ = static_cast<int>(config_.display.height);
    }

    images_ = std::make_unique<ImageLibrary>(config_.assetsDir, width_, height_);
    fonts_ = std::make_unique<FontManager>(config_.assetsDir);
    painter_ = std::make_unique<CardRenderer>(*images_, *fonts_, width_, height_);
    videos_ = std::make_unique<DirectoryVideoCatalog>(config_.assetsDir, width_, height_);
    animator_ = std::make_unique<EventAnimator>(width_, height_, videos_.get());

    setupScheduler();

    RotationController::Timing timing;
    timing.displayDuration = config_.rotation.displayDuration;
    timing.transitionDuration = config_.rotation.transitionDuration;
    timing.transition = Transition::parse(config_.rotation.transition);
    rotation_ = std::make_unique<RotationController>(scheduler_, *painter_, *animator_, timing);
    rotation_->setDisplaySnapshot(initial);

    setupDatabase();
    setupWeather();

    refresh_ = std::make_unique<RefreshOrchestrator>(*client_, *rotation_, database_.get(), weather_.get());
    refresh_->storeSnapshot(*initial);
    refresh_->refreshWeather();
    refresh_->start(config_.api, config_.weather);

    setupDashboard();
}

void Application::setupScheduler() {
    if (!args_.testEvent.empty()) {
        if (!scheduler_.injectTestEvent(args_.testEvent, TimeHelper::Clock::now())) {
            Logger::warn(Logger::Source::Scheduler, tag_, "Test event ignored: %s", args_.testEvent.c_str());
        }
        return;
    }
    if (config_.events.fireworks.enabled || config_.events.parades.enabled) {
        scheduler_ = EventScheduler(config_.events);
        Logger::info(Logger::Source::Scheduler, tag_, "Event scheduler initialized with %zu shows",
                     scheduler_.events().size());
    } else {
        Logger::info(Logger::Source::Scheduler, tag_, "Special events disabled (no events configured)");
    }
}

void Application::setupDatabase() {
    if (config_.database.path.empty()) {
        return;
    }
    try {
        database_ = std::make_unique<WaitTimesDatabase>(config_.database.path, config_.database.retentionDays);
        Logger::info(Logger::Source::Database, tag_, "Database initialized for historical data");
    } catch (const database_exception &e) {
        Logger::error(Logger::Source::Database, tag_, "History disabled: %s", e.what());
    }
}

void Application::setupWeather() {
    if (!config_.weather.enabled || config_.weather.apiKey.empty()) {
        Logger::info(Logger::Source::Weather, tag_, "Weather display disabled (no API key configured)");
        return;
    }
    weatherTransport_ = std::make_unique<CurlTransport>(config_.api.timeout);
    weather_ = std::make_unique<WeatherClient>(*weatherTransport_, config_.weather);
}

void Application::setupDashboard() {
    if (!config_.web.enabled) {
        return;
    }
    if (!database_) {
        Logger::warn(Logger::Source::Web, tag_, "Dashboard needs PARKWAIT_DATABASE_PATH, not started");
        return;
    }
    routes_ = std::make_unique<DashboardRoutes>(database_.get());
    server_ = std::make_unique<DashboardServer>(*routes_, config_.web.host,
                                                static_cast<uint16_t>(config_.web.port));
    if (!server_->start()) {
        server_.reset();
    }
}

void Application::mainLoop() {
    Logger::info(Logger::Source::Display, tag_, "Entering main display loop");

    FrameComposer composer(*painter_, *animator_);
    FrameClock clock(config_.display.fps);
    KeyboardInput keyboard;
    Surface frame(width_, height_);

    while (!SignalHelper::shouldExit(signals_)) {
        const double dt = clock.tick();

        switch (keyboard.poll()) {
            case KeyboardInput::Key::QUIT:
                Logger::info(Logger::Source::Display, tag_, "Quit requested");
                return;
            case KeyboardInput::Key::SKIP:
                rotation_->skip();
                break;
            default:
                break;
        }

        if (signals_.reload) {
            SignalHelper::clearFlag(signals_.reload);
            Logger::closeFile();
            if (!config_.logging.file.empty() && !Logger::openFile(config_.logging.file)) {
                Logger::setConsoleEnabled(true);
                Logger::warn(Logger::Source::Other, tag_, "Cannot reopen %s", config_.logging.file.c_str());
            }
        }

        rotation_->tick(dt);
        composer.compose(rotation_->currentRenderItem(), frame);
        display_->present(frame);
    }
    Logger::info(Logger::Source::Other, tag_, "Interrupted by signal");
}

void Application::shutdown() {
    if (server_) {
        server_->stop();
        server_.reset();
    }
    if (refresh_) {
        refresh_->stop();
        refresh_.reset();
    }
    if (display_) {
        display_->clear();
    }
}
