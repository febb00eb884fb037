#pragma once

#include <memory>

#include "animation/EventAnimator.h"
#include "animation/FrameSource.h"
#include "api/HttpTransport.h"
#include "api/QueueTimesClient.h"
#include "api/WeatherClient.h"
#include "core/Config.h"
#include "data/WaitTimesDatabase.h"
#include "display/CardRenderer.h"
#include "display/FontManager.h"
#include "display/FramebufferDisplay.h"
#include "display/ImageLibrary.h"
#include "display/RotationController.h"
#include "events/EventScheduler.h"
#include "refresh/RefreshOrchestrator.h"
#include "utils/ArgumentParser.h"
#include "utils/SignalHelper.h"
#include "web/DashboardRoutes.h"
#include "web/DashboardServer.h"

/**
 * @brief Owns every long-lived component of the kiosk.
 *
 * Built in setup(), torn down in reverse order by shutdown() and the
 * member destructors. No component reaches another through globals.
 */
class Application {
public:
    Application(Config::AppConfig config, ArgumentParser::AppArgs args);
    ~Application();

    Application(const Application &) = delete;
    Application &operator=(const Application &) = delete;

    /**
     * @return Process exit code
     */
    int run();

private:
    static constexpr auto tag_{"App"};

    Config::AppConfig config_;
    ArgumentParser::AppArgs args_;
    SignalHelper::Flags signals_;

    // Declaration order is construction order; destruction runs backwards.
    std::unique_ptr<CurlGlobal> curl_;
    std::unique_ptr<CurlTransport> apiTransport_;
    std::unique_ptr<CurlTransport> weatherTransport_;
    std::unique_ptr<QueueTimesClient> client_;
    std::unique_ptr<WeatherClient> weather_;
    std::unique_ptr<WaitTimesDatabase> database_;

    std::unique_ptr<FramebufferDisplay> display_;
    std::unique_ptr<ImageLibrary> images_;
    std::unique_ptr<FontManager> fonts_;
    std::unique_ptr<CardRenderer> painter_;
    std::unique_ptr<DirectoryVideoCatalog> videos_;
    std::unique_ptr<EventAnimator> animator_;
    EventScheduler scheduler_;
    std::unique_ptr<RotationController> rotation_;

    std::unique_ptr<RefreshOrchestrator> refresh_;
    std::unique_ptr<DashboardRoutes> routes_;
    std::unique_ptr<DashboardServer> server_;

    int width_{0};
    int height_{0};

    void setup(std::shared_ptr<const WaitTimesData> initial);
    void setupScheduler();
    void setupDatabase();
    void setupWeather();
    void setupDashboard();
    void mainLoop();
    void shutdown();
};
