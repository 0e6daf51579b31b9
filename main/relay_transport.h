#pragma once

// =============================================================================
// Relay Transport Interface
// =============================================================================
// Publish/subscribe on named channels. Publishing is fire-and-forget; the
// transport owns delivery, backpressure and reconnection. Subscription
// handlers run on the transport's receive thread and must not block.
//
// UdpRelayTransport talks to a RelayHub; tests use an in-process loopback.
// =============================================================================

#include <functional>
#include <string>

class RelayTransport {
public:
    typedef std::function<void(const std::string& channel, const std::string& payload)> MessageHandler;

    virtual ~RelayTransport() {}

    virtual bool begin() = 0;
    virtual void end() = 0;

    // Heard from the relay recently
    virtual bool isConnected() const = 0;

    // Queue a message for delivery. Returns false only if the transport is
    // not running; delivery itself is not confirmed.
    virtual bool publish(const std::string& channel, const std::string& payload) = 0;

    // Register before begin(). One handler per channel.
    virtual void subscribe(const std::string& channel, MessageHandler handler) = 0;
};
