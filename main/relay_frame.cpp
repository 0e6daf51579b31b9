// =============================================================================
// Relay Datagram Framing - Implementation
// =============================================================================

#include "relay_frame.h"

std::string encodeRelayFrame(const RelayFrame& frame) {
    std::string channel = frame.channel.substr(0, RELAY_MAX_CHANNEL);
    std::string out;
    out.reserve(3 + channel.size() + frame.payload.size());
    out.push_back((char)RELAY_FRAME_MAGIC);
    out.push_back((char)frame.op);
    out.push_back((char)channel.size());
    out += channel;
    out += frame.payload;
    return out;
}

bool decodeRelayFrame(const uint8_t* data, size_t len, RelayFrame& out) {
    if (len < 3 || data[0] != RELAY_FRAME_MAGIC) {
        return false;
    }

    uint8_t op = data[1];
    if (op < (uint8_t)RelayOp::SUBSCRIBE || op > (uint8_t)RelayOp::WELCOME) {
        return false;
    }

    size_t chanLen = data[2];
    if (chanLen == 0 || chanLen > RELAY_MAX_CHANNEL || 3 + chanLen > len) {
        return false;
    }

    out.op = (RelayOp)op;
    out.channel.assign((const char*)data + 3, chanLen);
    out.payload.assign((const char*)data + 3 + chanLen, len - 3 - chanLen);
    return true;
}
