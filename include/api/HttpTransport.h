#pragma once

#include <string>

/**
 * @brief Reply to an HTTP GET.
 */
struct HttpResponse {
    long status{0};
    std::string body;
};

/**
 * @brief Blocking HTTP GET, the only network primitive the clients need.
 */
class HttpTransport {
public:
    virtual ~HttpTransport() = default;

    /**
     * @throws api_exception On connection failure or timeout
     */
    virtual HttpResponse get(const std::string &url) = 0;
};

/**
 * @brief Process-wide libcurl initialisation, held for the program's lifetime.
 */
class CurlGlobal {
public:
    CurlGlobal();
    ~CurlGlobal();

    CurlGlobal(const CurlGlobal &) = delete;
    CurlGlobal &operator=(const CurlGlobal &) = delete;
};

/**
 * @brief libcurl-backed transport. One easy handle per request.
 */
class CurlTransport : public HttpTransport {
public:
    explicit CurlTransport(long timeoutSeconds);

    HttpResponse get(const std::string &url) override;

private:
    long timeoutSeconds_;
};
