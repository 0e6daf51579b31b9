// =============================================================================
// Web Server Module - Implementation
// =============================================================================
// One Beast session per connection: read a request, route it, write the
// reply, close. No keep-alive; pollers reconnect every time.
// =============================================================================

#include "web_server.h"
#include "config.h"
#include "debug_log.h"

#include <boost/asio/post.hpp>
#include <boost/beast/core.hpp>
#include <boost/beast/http.hpp>

#include <chrono>
#include <cstdlib>

namespace beast = boost::beast;
namespace http = boost::beast::http;
using boost::asio::ip::tcp;

static const char* TAG = "WebServer";

static const std::chrono::seconds SESSION_TIMEOUT(5);

// ---------------------------------------------------------------------------
// Connection session
// ---------------------------------------------------------------------------

class HttpSession : public std::enable_shared_from_this<HttpSession> {
public:
    HttpSession(tcp::socket socket, WebServerManager& server)
        : _stream(std::move(socket)), _server(server) {
    }

    void start() {
        _stream.expires_after(SESSION_TIMEOUT);
        auto self = shared_from_this();
        http::async_read(_stream, _buffer, _request,
            [self](beast::error_code ec, size_t) { self->onRead(ec); });
    }

private:
    beast::tcp_stream _stream;
    beast::flat_buffer _buffer;
    http::request<http::string_body> _request;
    http::response<http::string_body> _response;
    WebServerManager& _server;

    void onRead(beast::error_code ec) {
        if (ec) {
            if (ec != http::error::end_of_stream) {
                LOG_DEBUG(TAG, "Read failed: %s", ec.message().c_str());
            }
            return;
        }

        _response.version(_request.version());
        _response.keep_alive(false);
        _response.set(http::field::server, "armmirror");
        _response.set(http::field::access_control_allow_origin, "*");

        if (_request.method() != http::verb::get) {
            _response.result(http::status::method_not_allowed);
            _response.set(http::field::content_type, "text/plain");
            _response.body() = "GET only";
        } else {
            std::string target(_request.target().data(), _request.target().size());
            HttpReply reply = _server.handle(target);
            _response.result(reply.status);
            _response.set(http::field::content_type, reply.contentType);
            _response.body() = reply.body;
        }
        _response.prepare_payload();
        _server._requests++;

        auto self = shared_from_this();
        http::async_write(_stream, _response,
            [self](beast::error_code writeEc, size_t) { self->onWrite(writeEc); });
    }

    void onWrite(beast::error_code ec) {
        if (ec) {
            LOG_DEBUG(TAG, "Write failed: %s", ec.message().c_str());
        }
        beast::error_code closeEc;
        _stream.socket().shutdown(tcp::socket::shutdown_send, closeEc);
    }
};

// ---------------------------------------------------------------------------
// JSON bodies
// ---------------------------------------------------------------------------

std::string WebServerManager::buildStatusJson() const {
    JsonDocument doc;
    JsonObject root = doc.to<JsonObject>();
    if (_provider) {
        _provider(root);
    }

    JsonObject sys = doc["system"].to<JsonObject>();
    sys["uptime_s"] = (unsigned long)(logMillis() / 1000);
    sys["logHead"] = logRingGetHead();

    std::string output;
    serializeJson(doc, output);
    return output;
}

std::string WebServerManager::buildLogsJson(uint32_t sinceSeq) const {
    LogEntry entries[STATUS_LOG_BATCH];
    int count = logRingGetSince(sinceSeq, entries, STATUS_LOG_BATCH);

    JsonDocument doc;
    doc["head"] = logRingGetHead();
    JsonArray arr = doc["entries"].to<JsonArray>();
    for (int i = 0; i < count; i++) {
        arr.add(entries[i].text);
    }
    // Where the next poll should resume
    doc["next"] = count > 0 ? entries[count - 1].seq + 1 : sinceSeq;

    std::string output;
    serializeJson(doc, output);
    return output;
}

// ---------------------------------------------------------------------------
// Routing
// ---------------------------------------------------------------------------

static uint32_t parseSince(const std::string& query) {
    size_t pos = 0;
    while (pos < query.size()) {
        size_t amp = query.find('&', pos);
        std::string pair = query.substr(pos, amp == std::string::npos ? std::string::npos : amp - pos);
        if (pair.compare(0, 6, "since=") == 0) {
            return (uint32_t)strtoul(pair.c_str() + 6, NULL, 10);
        }
        if (amp == std::string::npos) {
            break;
        }
        pos = amp + 1;
    }
    return 0;
}

HttpReply WebServerManager::handle(const std::string& target) const {
    std::string path = target;
    std::string query;
    size_t q = target.find('?');
    if (q != std::string::npos) {
        path = target.substr(0, q);
        query = target.substr(q + 1);
    }

    HttpReply reply;
    if (path == "/status") {
        reply.contentType = "application/json";
        reply.body = buildStatusJson();
    } else if (path == "/logs") {
        reply.contentType = "application/json";
        reply.body = buildLogsJson(parseSince(query));
    } else if (path == "/health") {
        reply.body = "ok";
    } else {
        reply.status = 404;
        reply.body = "not found";
    }
    return reply;
}

// ---------------------------------------------------------------------------
// Lifecycle
// ---------------------------------------------------------------------------

WebServerManager::WebServerManager(StatusProvider provider)
    : _provider(provider) {
}

WebServerManager::~WebServerManager() {
    end();
}

bool WebServerManager::begin(uint16_t port, const std::string& address) {
    if (_started) {
        return true;
    }

    boost::system::error_code ec;
    boost::asio::ip::address bindAddress = boost::asio::ip::make_address(address, ec);
    if (ec) {
        LOG_ERROR(TAG, "Bad bind address '%s': %s", address.c_str(), ec.message().c_str());
        return false;
    }

    tcp::endpoint endpoint(bindAddress, port);
    _acceptor = std::make_unique<tcp::acceptor>(_io);
    _acceptor->open(endpoint.protocol(), ec);
    if (!ec) {
        _acceptor->set_option(boost::asio::socket_base::reuse_address(true), ec);
    }
    if (!ec) {
        _acceptor->bind(endpoint, ec);
    }
    if (!ec) {
        _acceptor->listen(boost::asio::socket_base::max_listen_connections, ec);
    }
    if (ec) {
        LOG_ERROR(TAG, "Failed to listen on %s:%u: %s", address.c_str(), port, ec.message().c_str());
        _acceptor.reset();
        return false;
    }

    _boundPort = _acceptor->local_endpoint(ec).port();
    if (ec) {
        LOG_ERROR(TAG, "Cannot read bound port: %s", ec.message().c_str());
        _acceptor.reset();
        return false;
    }

    startAccept();
    _io.restart();
    _thread = std::thread([this]() { _io.run(); });
    _started = true;

    LOG_INFO(TAG, "Status server ready at http://%s:%u/status", address.c_str(), _boundPort);
    return true;
}

void WebServerManager::startAccept() {
    _acceptor->async_accept([this](boost::system::error_code ec, tcp::socket socket) {
        if (ec) {
            if (ec != boost::asio::error::operation_aborted) {
                LOG_WARN(TAG, "Accept failed: %s", ec.message().c_str());
                startAccept();
            }
            return;
        }
        std::make_shared<HttpSession>(std::move(socket), *this)->start();
        startAccept();
    });
}

void WebServerManager::end() {
    if (!_started) {
        return;
    }
    boost::asio::post(_io, [this]() {
        boost::system::error_code ec;
        _acceptor->close(ec);
        _io.stop();
    });
    if (_thread.joinable()) {
        _thread.join();
    }
    _acceptor.reset();
    _started = false;
    LOG_INFO(TAG, "Status server stopped (%llu requests)", (unsigned long long)_requests.load());
}

bool WebServerManager::isRunning() const {
    return _started;
}
