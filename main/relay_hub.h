#pragma once

// =============================================================================
// Relay Hub
// =============================================================================
// The UDP process leader and follower hosts both connect to. Keeps a
// subscriber list per channel (refreshed by SUBSCRIBE, expired after
// RELAY_SUBSCRIBER_TTL_MS of silence) and forwards each PUBLISH as DELIVER
// to every subscriber of that channel except the sender.
//
// Usage:
//   boost::asio::io_context io;
//   RelayHub hub(io, 7400);
//   if (hub.begin()) { io.run(); }
// =============================================================================

#include "config.h"

#include <boost/asio/io_context.hpp>
#include <boost/asio/ip/udp.hpp>
#include <boost/asio/steady_timer.hpp>

#include <array>
#include <map>
#include <string>

class RelayHub {
public:
    RelayHub(boost::asio::io_context& io, uint16_t port);

    bool begin();
    void end();

    // Actual bound port (useful when constructed with port 0)
    uint16_t port() const;

    size_t subscriberCount(const std::string& channel) const;
    uint64_t forwarded() const { return _forwarded; }

private:
    typedef boost::asio::ip::udp::endpoint Endpoint;

    boost::asio::io_context& _io;
    uint16_t _port;
    boost::asio::ip::udp::socket _socket;
    boost::asio::steady_timer _sweepTimer;
    Endpoint _from;
    std::array<uint8_t, RELAY_MAX_DATAGRAM> _rxBuf;
    bool _running = false;

    // channel -> subscriber -> last heard (ms)
    std::map<std::string, std::map<Endpoint, unsigned long>> _subscribers;
    uint64_t _forwarded = 0;

    void startReceive();
    void handleDatagram(size_t len);
    void armSweep();
    void sweep();
};
