#pragma once

#include <atomic>
#include <cstdint>
#include <string>
#include <thread>

#include "web/DashboardRoutes.h"

/**
 * @brief Minimal HTTP/1.1 server for the dashboard API.
 *
 * One listening socket served from a dedicated thread, one request per
 * connection (Connection: close). The accept loop polls with a short
 * timeout so stop() returns promptly.
 */
class DashboardServer {
public:
    DashboardServer(const DashboardRoutes &routes, std::string host, uint16_t port);
    ~DashboardServer();

    DashboardServer(const DashboardServer &) = delete;
    DashboardServer &operator=(const DashboardServer &) = delete;

    /**
     * @return false if the socket could not be bound (logged)
     */
    bool start();

    void stop();

    /** Bound port; differs from the requested one when 0 was requested. */
    uint16_t port() const { return port_; }

private:
    static constexpr auto tag_{"Web"};
    static constexpr int POLL_TIMEOUT_MS{200};
    static constexpr size_t MAX_REQUEST_BYTES{8192};

    const DashboardRoutes &routes_;
    std::string host_;
    uint16_t port_;
    int listenFd_{-1};
    std::atomic<bool> running_{false};
    std::thread thread_;

    void serve();
    void handleClient(int fd) const;
};
