#include "web/DashboardServer.h"
#include "logging/Logger.h"

#include <arpa/inet.h>
#include <cstring>
#include <netinet/in.h>
#include <poll.h>
#include <sstream>
#include <sys/socket.h>
#include <unistd.h>

namespace {
    const char *reasonPhrase(int status) {
        switch (status) {
            case 200: return "OK";
            case 400: return "Bad Request";
            case 404: return "Not Found";
            case 405: return "Method Not Allowed";
            case 500: return "Internal Server Error";
            default: return "Unknown";
        }
    }

    bool sendAll(int fd, const std::string &data) {
        size_t sent = 0;
        while (sent < data.size()) {
            const ssize_t n = send(fd, data.data() + sent, data.size() - sent, MSG_NOSIGNAL);
            if (n <= 0) {
                return false;
            }
            sent += static_cast<size_t>(n);
        }
        return true;
    }
}

DashboardServer::DashboardServer(const DashboardRoutes &routes, std::string host, uint16_t port)
    : routes_{routes}, host_{std::move(host)}, port_{port} {
}

DashboardServer::~DashboardServer() {
    stop();
}

bool DashboardServer::start() {
    listenFd_ = socket(AF_INET, SOCK_STREAM | SOCK_CLOEXEC, 0);
    if (listenFd_ == -1) {
        Logger::perror(Logger::Source::Web, tag_, "socket");
        return false;
    }
    const int reuse = 1;
    if (setsockopt(listenFd_, SOL_SOCKET, SO_REUSEADDR, &reuse, sizeof(reuse)) == -1) {
        Logger::perror(Logger::Source::Web, tag_, "setsockopt SO_REUSEADDR");
    }

    sockaddr_in addr{};
    addr.sin_family = AF_INET;
    addr.sin_port = htons(port_);
    if (inet_pton(AF_INET, host_.c_str(), &addr.sin_addr) != 1) {
        Logger::error(Logger::Source::Web, tag_, "Invalid listen address: %s", host_.c_str());
        close(listenFd_);
        listenFd_ = -1;
        return false;
    }
    if (bind(listenFd_, reinterpret_cast<sockaddr *>(&addr), sizeof(addr)) == -1 || listen(listenFd_, 16) == -1) {
        Logger::perror(Logger::Source::Web, tag_, "bind/listen");
        close(listenFd_);
        listenFd_ = -1;
        return false;
    }

    socklen_t len = sizeof(addr);
    if (getsockname(listenFd_, reinterpret_cast<sockaddr *>(&addr), &len) == 0) {
        port_ = ntohs(addr.sin_port);
    }

    running_ = true;
    thread_ = std::thread([this]() { serve(); });
    Logger::info(Logger::Source::Web, tag_, "Dashboard listening on http://%s:%u", host_.c_str(), port_);
    return true;
}

void DashboardServer::stop() {
    running_ = false;
    if (thread_.joinable()) {
        thread_.join();
    }
    if (listenFd_ != -1) {
        close(listenFd_);
        listenFd_ = -1;
        Logger::info(Logger::Source::Web, tag_, "Dashboard stopped");
    }
}

void DashboardServer::serve() {
    while (running_) {
        pollfd pfd{listenFd_, POLLIN, 0};
        const int ready = poll(&pfd, 1, POLL_TIMEOUT_MS);
        if (ready <= 0) {
            continue;
        }
        const int client = accept4(listenFd_, nullptr, nullptr, SOCK_CLOEXEC);
        if (client == -1) {
            continue;
        }
        handleClient(client);
        close(client);
    }
}

void DashboardServer::handleClient(int fd) const {
    std::string request;
    char buf[1024];
    while (request.find("\r\n\r\n") == std::string::npos && request.size() < MAX_REQUEST_BYTES) {
        pollfd pfd{fd, POLLIN, 0};
        if (poll(&pfd, 1, 1000) <= 0) {
            break;
        }
        const ssize_t n = recv(fd, buf, sizeof(buf), 0);
        if (n <= 0) {
            break;
        }
        request.append(buf, static_cast<size_t>(n));
    }

    std::istringstream line(request.substr(0, request.find("\r\n")));
    std::string method, target, version;
    HttpReply reply;
    if (!(line >> method >> target >> version)) {
        reply = HttpReply{400, R"({"error":"Bad request"})"};
    } else {
        reply = routes_.handle(method, target);
        Logger::debug(Logger::Source::Web, tag_, "%s %s -> %d", method.c_str(), target.c_str(), reply.status);
    }

    std::string response = "HTTP/1.1 " + std::to_string(reply.status) + " " + reasonPhrase(reply.status) + "\r\n";
    response += "Content-Type: application/json\r\n";
    response += "Content-Length: " + std::to_string(reply.body.size()) + "\r\n";
    response += "Connection: close\r\n\r\n";
    response += reply.body;
    if (!sendAll(fd, response)) {
        Logger::debug(Logger::Source::Web, tag_, "client closed before reply was sent");
    }
}
