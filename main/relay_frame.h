#pragma once

// =============================================================================
// Relay Datagram Framing
// =============================================================================
// One UDP datagram per frame:
//
//   byte 0     'R' magic
//   byte 1     op (RelayOp)
//   byte 2     channel name length N (1-64)
//   3..3+N     channel name
//   rest       payload (opaque, MessagePack for PUBLISH/DELIVER)
//
// SUBSCRIBE    client -> hub   join (or keep alive) one channel, empty payload
// PUBLISH      client -> hub   fan out payload to the channel's other subscribers
// DELIVER      hub -> client   a payload published by someone else
// WELCOME      hub -> client   reply to SUBSCRIBE
// =============================================================================

#include <stdint.h>
#include <string>

static const uint8_t RELAY_FRAME_MAGIC = 'R';
static const size_t  RELAY_MAX_CHANNEL = 64;

enum class RelayOp : uint8_t {
    SUBSCRIBE = 1,
    PUBLISH   = 2,
    DELIVER   = 3,
    WELCOME   = 4
};

struct RelayFrame {
    RelayOp op = RelayOp::PUBLISH;
    std::string channel;
    std::string payload;
};

std::string encodeRelayFrame(const RelayFrame& frame);

// False on bad magic, unknown op or truncated channel.
bool decodeRelayFrame(const uint8_t* data, size_t len, RelayFrame& out);
