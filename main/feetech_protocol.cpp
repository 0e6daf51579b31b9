// =============================================================================
// Feetech STS Protocol - Packet Codec
// =============================================================================

#include "feetech_protocol.h"
#include "config.h"

#include <ctype.h>
#include <stdlib.h>

uint8_t feetechChecksum(const uint8_t* body, size_t len) {
    uint32_t sum = 0;
    for (size_t i = 0; i < len; i++) {
        sum += body[i];
    }
    return (uint8_t)(~sum & 0xFF);
}

std::vector<uint8_t> feetechBuildPacket(uint8_t id, uint8_t instr,
                                        const std::vector<uint8_t>& params) {
    std::vector<uint8_t> pkt;
    pkt.reserve(params.size() + 6);
    pkt.push_back(FEETECH_HEADER);
    pkt.push_back(FEETECH_HEADER);
    pkt.push_back(id);
    pkt.push_back((uint8_t)(params.size() + 2));
    pkt.push_back(instr);
    pkt.insert(pkt.end(), params.begin(), params.end());
    // Checksum covers ID..last param
    pkt.push_back(feetechChecksum(pkt.data() + 2, pkt.size() - 2));
    return pkt;
}

std::vector<uint8_t> feetechBuildPing(uint8_t id) {
    return feetechBuildPacket(id, FeetechInst::PING, {});
}

std::vector<uint8_t> feetechBuildRead(uint8_t id, const MotorRegister& reg) {
    return feetechBuildPacket(id, FeetechInst::READ, { reg.address, reg.size });
}

std::vector<uint8_t> feetechBuildWrite(uint8_t id, const MotorRegister& reg, uint16_t value) {
    std::vector<uint8_t> params;
    params.push_back(reg.address);
    params.push_back((uint8_t)(value & 0xFF));
    if (reg.size == 2) {
        params.push_back((uint8_t)((value >> 8) & 0xFF));
    }
    return feetechBuildPacket(id, FeetechInst::WRITE, params);
}

FeetechParse feetechParseStatus(const uint8_t* buf, size_t len,
                                FeetechStatus& out, size_t* consumed) {
    if (len < 4) {
        return FeetechParse::INCOMPLETE;
    }
    if (buf[0] != FEETECH_HEADER || buf[1] != FEETECH_HEADER) {
        return FeetechParse::CORRUPT;
    }

    uint8_t pktLen = buf[3];
    if (pktLen < 2) {
        return FeetechParse::CORRUPT;
    }

    size_t total = (size_t)pktLen + 4;
    if (len < total) {
        return FeetechParse::INCOMPLETE;
    }

    uint8_t expected = feetechChecksum(buf + 2, total - 3);
    if (buf[total - 1] != expected) {
        return FeetechParse::CORRUPT;
    }

    out.id = buf[2];
    out.error = buf[4];
    out.params.assign(buf + 5, buf + total - 1);
    if (consumed != nullptr) {
        *consumed = total;
    }
    return FeetechParse::OK;
}

uint16_t feetechDecodeValue(const std::vector<uint8_t>& params, uint8_t size) {
    if (size == 1) {
        return params.empty() ? 0 : params[0];
    }
    if (params.size() < 2) {
        return 0;
    }
    return (uint16_t)(params[0] | (params[1] << 8));
}

uint16_t encodeSignMagnitude(int value, int signBit) {
    int maxMagnitude = (1 << signBit) - 1;
    int magnitude = value < 0 ? -value : value;
    if (magnitude > maxMagnitude) {
        magnitude = maxMagnitude;
    }
    uint16_t encoded = (uint16_t)magnitude;
    if (value < 0) {
        encoded |= (uint16_t)(1 << signBit);
    }
    return encoded;
}

int decodeSignMagnitude(uint16_t encoded, int signBit) {
    int magnitude = encoded & ((1 << signBit) - 1);
    if (encoded & (1 << signBit)) {
        return -magnitude;
    }
    return magnitude;
}

bool feetechParseId(const char* text, uint8_t& id) {
    if (text == nullptr || !isdigit((unsigned char)text[0])) {
        return false;
    }
    char* end = nullptr;
    long value = strtol(text, &end, 10);
    if (*end != '\0' || value > SERVO_MAX_ID) {
        return false;
    }
    id = (uint8_t)value;
    return true;
}
