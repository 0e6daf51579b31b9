#pragma once

// =============================================================================
// Web Server Module
// =============================================================================
// Optional HTTP status endpoint (Boost.Beast) running on its own io thread.
// Plain GET requests, polled by whatever tool is watching the rig:
//
//   GET /status           JSON from the active mode's status provider
//   GET /logs?since=N     ring-buffer log lines with seq >= N, plus "head"
//   GET /health           "ok"
//
// Usage:
//   WebServerManager webServer([&](JsonObject out) { loop.fillStatus(out); });
//   webServer.begin(8080);   // 0 picks a free port, see port()
//   ...
//   webServer.end();
// =============================================================================

#include <ArduinoJson.h>

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/tcp.hpp>

#include <atomic>
#include <functional>
#include <memory>
#include <string>
#include <thread>

struct HttpReply {
    unsigned int status = 200;
    std::string contentType = "text/plain";
    std::string body;
};

class WebServerManager {
public:
    typedef std::function<void(JsonObject)> StatusProvider;

    explicit WebServerManager(StatusProvider provider);
    ~WebServerManager();

    // Bind and start serving. Returns false if the port cannot be bound.
    bool begin(uint16_t port, const std::string& address = "0.0.0.0");

    void end();

    bool isRunning() const;

    // Bound port (valid after begin)
    uint16_t port() const { return _boundPort; }

    // Route one GET target ("/logs?since=4") to its reply
    HttpReply handle(const std::string& target) const;

    uint64_t requestsServed() const { return _requests; }

private:
    StatusProvider _provider;
    boost::asio::io_context _io;
    std::unique_ptr<boost::asio::ip::tcp::acceptor> _acceptor;
    std::thread _thread;
    std::atomic<bool> _started{false};
    std::atomic<uint64_t> _requests{0};
    uint16_t _boundPort = 0;

    void startAccept();
    std::string buildStatusJson() const;
    std::string buildLogsJson(uint32_t sinceSeq) const;

    friend class HttpSession;
};
