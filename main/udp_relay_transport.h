#pragma once

// =============================================================================
// UDP Relay Transport
// =============================================================================
// RelayTransport client for a RelayHub. All socket work happens on one
// Boost.Asio io thread: publish() posts the datagram there, received
// DELIVER frames are dispatched to the channel's handler there.
//
// The client re-sends SUBSCRIBE for each channel every RELAY_RESUBSCRIBE_MS.
// That doubles as keepalive and as fixed-interval reconnect: a restarted hub
// picks the client back up within one interval. "Connected" means the hub
// answered within the last three intervals.
//
// Usage:
//   UdpRelayTransport relay("10.0.0.5", 7400, RELAY_RESUBSCRIBE_MS);
//   relay.subscribe(RELAY_CHANNEL_STATUS, onStatus);
//   relay.begin();
//   relay.publish(RELAY_CHANNEL_TELEMETRY, bytes);
//   relay.end();
// =============================================================================

#include "relay_transport.h"
#include "config.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <chrono>
#include <atomic>
#include <map>
#include <string>
#include <thread>

class UdpRelayTransport : public RelayTransport {
public:
    UdpRelayTransport(const std::string& host, uint16_t port, unsigned int resubscribeMs);
    ~UdpRelayTransport() override;

    bool begin() override;
    void end() override;
    bool isConnected() const override;
    bool publish(const std::string& channel, const std::string& payload) override;
    void subscribe(const std::string& channel, MessageHandler handler) override;

    uint64_t framesSent() const { return _framesSent; }
    uint64_t framesReceived() const { return _framesReceived; }

private:
    enum class State {
        IDLE,
        CONNECTING,
        CONNECTED,
        DISCONNECTED
    };

    std::string _host;
    uint16_t _port;
    std::chrono::milliseconds _resubscribe;

    boost::asio::io_context _io;
    boost::asio::ip::udp::socket _socket;
    boost::asio::ip::udp::endpoint _hub;
    boost::asio::ip::udp::endpoint _from;
    boost::asio::steady_timer _timer;
    std::thread _thread;

    std::array<uint8_t, RELAY_MAX_DATAGRAM> _rxBuf;
    std::map<std::string, MessageHandler> _handlers;

    std::atomic<State> _state{State::IDLE};
    std::atomic<bool> _stopping{false};
    std::atomic<unsigned long> _lastHeardMs{0};
    std::atomic<uint64_t> _framesSent{0};
    std::atomic<uint64_t> _framesReceived{0};

    // io thread only
    void startReceive();
    void handleDatagram(size_t len);
    void armTimer();
    void onTimer();
    void sendSubscriptions();
    void sendRaw(const std::string& bytes);
    void markHeard();
};
