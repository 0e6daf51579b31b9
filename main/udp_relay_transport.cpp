// =============================================================================
// UDP Relay Transport - Implementation
// =============================================================================

#include "udp_relay_transport.h"
#include "debug_log.h"
#include "relay_frame.h"

#include <boost/asio/buffer.hpp>
#include <boost/asio/post.hpp>

static const char* TAG = "Relay";

using boost::asio::ip::udp;

UdpRelayTransport::UdpRelayTransport(const std::string& host, uint16_t port, unsigned int resubscribeMs)
    : _host(host),
      _port(port),
      _resubscribe(resubscribeMs),
      _socket(_io),
      _timer(_io) {
}

UdpRelayTransport::~UdpRelayTransport() {
    end();
}

void UdpRelayTransport::subscribe(const std::string& channel, MessageHandler handler) {
    if (_state != State::IDLE) {
        LOG_WARN(TAG, "subscribe(%s) after begin() ignored", channel.c_str());
        return;
    }
    _handlers[channel] = handler;
}

bool UdpRelayTransport::begin() {
    if (_state != State::IDLE) {
        return true;
    }

    LOG_INFO(TAG, "Initializing relay client...");
    LOG_INFO(TAG, "Hub: %s:%u", _host.c_str(), _port);

    boost::system::error_code ec;
    udp::resolver resolver(_io);
    udp::resolver::results_type results = resolver.resolve(udp::v4(), _host, std::to_string(_port), ec);
    if (ec || results.empty()) {
        LOG_ERROR(TAG, "Can't resolve %s: %s", _host.c_str(), ec ? ec.message().c_str() : "no address");
        return false;
    }
    _hub = results.begin()->endpoint();

    _socket.open(udp::v4(), ec);
    if (!ec) {
        _socket.bind(udp::endpoint(udp::v4(), 0), ec);
    }
    if (ec) {
        LOG_ERROR(TAG, "UDP socket setup failed: %s", ec.message().c_str());
        return false;
    }

    _stopping = false;
    _state = State::CONNECTING;
    startReceive();
    sendSubscriptions();
    armTimer();

    _thread = std::thread([this]() { _io.run(); });
    LOG_INFO(TAG, "Connecting to %s (%d channel(s))...",
             _hub.address().to_string().c_str(), (int)_handlers.size());
    return true;
}

void UdpRelayTransport::end() {
    if (_state == State::IDLE) {
        return;
    }

    // Queued publishes run before the shutdown handler
    boost::asio::post(_io, [this]() {
        _stopping = true;
        _timer.cancel();
        boost::system::error_code ec;
        _socket.close(ec);
    });
    if (_thread.joinable()) {
        _thread.join();
    }
    _state = State::IDLE;
    LOG_INFO(TAG, "Relay client stopped (sent %llu, received %llu frames)",
             (unsigned long long)_framesSent, (unsigned long long)_framesReceived);
}

bool UdpRelayTransport::isConnected() const {
    return _state == State::CONNECTED;
}

bool UdpRelayTransport::publish(const std::string& channel, const std::string& payload) {
    if (_state == State::IDLE || _stopping) {
        return false;
    }
    RelayFrame frame;
    frame.op = RelayOp::PUBLISH;
    frame.channel = channel;
    frame.payload = payload;
    std::string bytes = encodeRelayFrame(frame);
    if (bytes.size() > RELAY_MAX_DATAGRAM) {
        LOG_WARN(TAG, "Message on %s too large (%d bytes), dropped", channel.c_str(), (int)bytes.size());
        return false;
    }
    boost::asio::post(_io, [this, bytes]() { sendRaw(bytes); });
    return true;
}

// ---------------------------------------------------------------------------
// io thread
// ---------------------------------------------------------------------------

void UdpRelayTransport::sendRaw(const std::string& bytes) {
    if (_stopping || !_socket.is_open()) {
        return;
    }
    boost::system::error_code ec;
    _socket.send_to(boost::asio::buffer(bytes), _hub, 0, ec);
    if (ec) {
        LOG_DEBUG(TAG, "send failed: %s", ec.message().c_str());
        return;
    }
    _framesSent++;
}

void UdpRelayTransport::sendSubscriptions() {
    for (const auto& entry : _handlers) {
        RelayFrame frame;
        frame.op = RelayOp::SUBSCRIBE;
        frame.channel = entry.first;
        sendRaw(encodeRelayFrame(frame));
    }
}

void UdpRelayTransport::startReceive() {
    _socket.async_receive_from(boost::asio::buffer(_rxBuf), _from,
        [this](const boost::system::error_code& ec, size_t n) {
            if (ec == boost::asio::error::operation_aborted || _stopping) {
                return;
            }
            if (!ec) {
                handleDatagram(n);
            } else if (ec != boost::asio::error::connection_refused) {
                LOG_DEBUG(TAG, "receive: %s", ec.message().c_str());
            }
            startReceive();
        });
}

void UdpRelayTransport::handleDatagram(size_t len) {
    RelayFrame frame;
    if (!decodeRelayFrame(_rxBuf.data(), len, frame)) {
        LOG_DEBUG(TAG, "Bad frame (%d bytes) from %s", (int)len, _from.address().to_string().c_str());
        return;
    }

    _framesReceived++;
    markHeard();

    if (frame.op != RelayOp::DELIVER) {
        return;
    }
    auto it = _handlers.find(frame.channel);
    if (it != _handlers.end() && it->second) {
        it->second(frame.channel, frame.payload);
    }
}

void UdpRelayTransport::markHeard() {
    _lastHeardMs = logMillis();
    if (_state != State::CONNECTED) {
        _state = State::CONNECTED;
        LOG_INFO(TAG, "Connected to relay %s:%u", _host.c_str(), _port);
    }
}

void UdpRelayTransport::armTimer() {
    _timer.expires_after(_resubscribe);
    _timer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || _stopping) {
            return;
        }
        onTimer();
        armTimer();
    });
}

void UdpRelayTransport::onTimer() {
    unsigned long silentMs = logMillis() - _lastHeardMs;
    unsigned long limitMs = 3 * (unsigned long)_resubscribe.count();

    switch (_state.load()) {
        case State::CONNECTED:
            if (silentMs > limitMs) {
                LOG_WARN(TAG, "Relay silent for %lu ms, connection lost", silentMs);
                _state = State::DISCONNECTED;
            }
            break;
        case State::CONNECTING:
        case State::DISCONNECTED:
            LOG_DEBUG(TAG, "Re-subscribing (hub silent %lu ms)", silentMs);
            break;
        case State::IDLE:
            return;
    }

    sendSubscriptions();
}
