// =============================================================================
// Relay Hub - Implementation
// =============================================================================

#include "relay_hub.h"
#include "debug_log.h"
#include "relay_frame.h"

#include <boost/asio/buffer.hpp>

static const char* TAG = "Hub";

using boost::asio::ip::udp;

RelayHub::RelayHub(boost::asio::io_context& io, uint16_t port)
    : _io(io),
      _port(port),
      _socket(io),
      _sweepTimer(io) {
}

bool RelayHub::begin() {
    boost::system::error_code ec;
    _socket.open(udp::v4(), ec);
    if (!ec) {
        _socket.bind(udp::endpoint(udp::v4(), _port), ec);
    }
    if (ec) {
        LOG_ERROR(TAG, "Can't bind UDP port %u: %s", _port, ec.message().c_str());
        return false;
    }

    _running = true;
    startReceive();
    armSweep();
    LOG_INFO(TAG, "Relay hub listening on UDP %u", port());
    return true;
}

void RelayHub::end() {
    if (!_running) {
        return;
    }
    _running = false;
    _sweepTimer.cancel();
    boost::system::error_code ec;
    _socket.close(ec);
    LOG_INFO(TAG, "Relay hub stopped (%llu messages forwarded)", (unsigned long long)_forwarded);
}

uint16_t RelayHub::port() const {
    boost::system::error_code ec;
    udp::endpoint local = _socket.local_endpoint(ec);
    return ec ? _port : local.port();
}

size_t RelayHub::subscriberCount(const std::string& channel) const {
    auto it = _subscribers.find(channel);
    return it == _subscribers.end() ? 0 : it->second.size();
}

void RelayHub::startReceive() {
    _socket.async_receive_from(boost::asio::buffer(_rxBuf), _from,
        [this](const boost::system::error_code& ec, size_t n) {
            if (!_running || ec == boost::asio::error::operation_aborted) {
                return;
            }
            if (!ec) {
                handleDatagram(n);
            } else {
                LOG_DEBUG(TAG, "receive: %s", ec.message().c_str());
            }
            startReceive();
        });
}

void RelayHub::handleDatagram(size_t len) {
    RelayFrame frame;
    if (!decodeRelayFrame(_rxBuf.data(), len, frame)) {
        LOG_DEBUG(TAG, "Bad frame (%d bytes) from %s:%u", (int)len,
                  _from.address().to_string().c_str(), _from.port());
        return;
    }

    boost::system::error_code ec;
    switch (frame.op) {
        case RelayOp::SUBSCRIBE: {
            auto& subs = _subscribers[frame.channel];
            if (subs.find(_from) == subs.end()) {
                LOG_INFO(TAG, "%s:%u joined %s", _from.address().to_string().c_str(), _from.port(),
                         frame.channel.c_str());
            }
            subs[_from] = logMillis();

            RelayFrame welcome;
            welcome.op = RelayOp::WELCOME;
            welcome.channel = frame.channel;
            _socket.send_to(boost::asio::buffer(encodeRelayFrame(welcome)), _from, 0, ec);
            if (ec) {
                LOG_DEBUG(TAG, "welcome send failed: %s", ec.message().c_str());
            }
            break;
        }

        case RelayOp::PUBLISH: {
            RelayFrame deliver;
            deliver.op = RelayOp::DELIVER;
            deliver.channel = frame.channel;
            deliver.payload = frame.payload;
            std::string bytes = encodeRelayFrame(deliver);

            auto it = _subscribers.find(frame.channel);
            if (it == _subscribers.end()) {
                break;
            }
            for (const auto& sub : it->second) {
                if (sub.first == _from) {
                    continue;
                }
                _socket.send_to(boost::asio::buffer(bytes), sub.first, 0, ec);
                if (ec) {
                    LOG_DEBUG(TAG, "forward to %s:%u failed: %s", sub.first.address().to_string().c_str(),
                              sub.first.port(), ec.message().c_str());
                } else {
                    _forwarded++;
                }
            }
            break;
        }

        case RelayOp::DELIVER:
        case RelayOp::WELCOME:
            // Hub -> client only
            break;
    }
}

void RelayHub::armSweep() {
    _sweepTimer.expires_after(std::chrono::milliseconds(RELAY_RESUBSCRIBE_MS));
    _sweepTimer.async_wait([this](const boost::system::error_code& ec) {
        if (ec || !_running) {
            return;
        }
        sweep();
        armSweep();
    });
}

void RelayHub::sweep() {
    unsigned long now = logMillis();
    for (auto& channel : _subscribers) {
        auto& subs = channel.second;
        for (auto it = subs.begin(); it != subs.end();) {
            if (now - it->second > RELAY_SUBSCRIBER_TTL_MS) {
                LOG_INFO(TAG, "%s:%u left %s (silent)", it->first.address().to_string().c_str(),
                         it->first.port(), channel.first.c_str());
                it = subs.erase(it);
            } else {
                ++it;
            }
        }
    }
}
