#pragma once

// =============================================================================
// Feetech STS Serial Servo Protocol Definitions
// =============================================================================
// Protocol constants and packet codec for Feetech STS3215-class servos
// (SCS protocol 0, half-duplex TTL bus).
//
// Instruction packet:
//   0xFF 0xFF  ID  LEN  INSTR  PARAM_1 ... PARAM_N  CHECKSUM
// Status packet:
//   0xFF 0xFF  ID  LEN  ERROR  PARAM_1 ... PARAM_N  CHECKSUM
//
//   LEN      = N + 2
//   CHECKSUM = ~(ID + LEN + INSTR/ERROR + sum(PARAMS)) & 0xFF
//
// Multi-byte register values are little-endian.
// =============================================================================

#include <stddef.h>
#include <stdint.h>
#include <vector>

static const uint8_t FEETECH_HEADER       = 0xFF;
static const uint8_t FEETECH_BROADCAST_ID = 0xFE;
static const size_t  FEETECH_MIN_STATUS   = 6;     // FF FF ID LEN ERR CHK

// =============================================================================
// Instructions
// =============================================================================
namespace FeetechInst {
    static const uint8_t PING        = 0x01;
    static const uint8_t READ        = 0x02;
    static const uint8_t WRITE       = 0x03;
    static const uint8_t REG_WRITE   = 0x04;
    static const uint8_t ACTION      = 0x05;
    static const uint8_t SYNC_READ   = 0x82;
    static const uint8_t SYNC_WRITE  = 0x83;
}

// =============================================================================
// Status error bits (ERROR byte of a status packet)
// =============================================================================
namespace FeetechError {
    static const uint8_t VOLTAGE     = 0x01;
    static const uint8_t ANGLE       = 0x02;
    static const uint8_t OVERHEAT    = 0x04;
    static const uint8_t OVERELE     = 0x08;
    static const uint8_t OVERLOAD    = 0x20;
}

// =============================================================================
// Control table (STS3215)
// =============================================================================
struct MotorRegister {
    const char* name;
    uint8_t address;
    uint8_t size;       // 1 or 2 bytes
};

namespace FeetechReg {
    static const MotorRegister MIN_POSITION_LIMIT = { "Min_Position_Limit",  9, 2 };
    static const MotorRegister MAX_POSITION_LIMIT = { "Max_Position_Limit", 11, 2 };
    static const MotorRegister PHASE              = { "Phase",              18, 1 };
    static const MotorRegister HOMING_OFFSET      = { "Homing_Offset",      31, 2 };  // sign-magnitude, bit 11
    static const MotorRegister OPERATING_MODE     = { "Operating_Mode",     33, 1 };
    static const MotorRegister TORQUE_ENABLE      = { "Torque_Enable",      40, 1 };
    static const MotorRegister GOAL_POSITION      = { "Goal_Position",      42, 2 };
    static const MotorRegister LOCK               = { "Lock",               55, 1 };
    static const MotorRegister PRESENT_POSITION   = { "Present_Position",   56, 2 };
    static const MotorRegister PRESENT_VOLTAGE    = { "Present_Voltage",    62, 1 };  // 0.1 V per unit
}

// Parsed status packet
struct FeetechStatus {
    uint8_t id = 0;
    uint8_t error = 0;
    std::vector<uint8_t> params;
};

enum class FeetechParse {
    OK,
    INCOMPLETE,     // Need more bytes
    CORRUPT         // Bad header, length or checksum
};

// Checksum over ID, LEN, INSTR/ERROR and params (everything between header and checksum)
uint8_t feetechChecksum(const uint8_t* body, size_t len);

// Build a complete instruction packet
std::vector<uint8_t> feetechBuildPacket(uint8_t id, uint8_t instr,
                                        const std::vector<uint8_t>& params);

// Convenience builders
std::vector<uint8_t> feetechBuildPing(uint8_t id);
std::vector<uint8_t> feetechBuildRead(uint8_t id, const MotorRegister& reg);
std::vector<uint8_t> feetechBuildWrite(uint8_t id, const MotorRegister& reg, uint16_t value);

// Parse one status packet from the start of buf. On OK, *consumed is the
// packet length in bytes.
FeetechParse feetechParseStatus(const uint8_t* buf, size_t len,
                                FeetechStatus& out, size_t* consumed);

// Decode a register value from status params (little-endian, `size` bytes)
uint16_t feetechDecodeValue(const std::vector<uint8_t>& params, uint8_t size);

// Sign-magnitude with the sign at `signBit` (Homing_Offset uses bit 11).
// Magnitude must be < (1 << signBit); larger values are clamped.
uint16_t encodeSignMagnitude(int value, int signBit);
int decodeSignMagnitude(uint16_t encoded, int signBit);

// Parse a decimal servo id (0..SERVO_MAX_ID) used as a JSON object key.
// Rejects empty text, signs, trailing characters and out-of-range values.
bool feetechParseId(const char* text, uint8_t& id);

// Canonical position mapping for a calibrated motor
inline int canonicalPosition(int raw, int offset) { return raw - offset; }
inline int decanonicalPosition(int canonical, int offset) { return canonical + offset; }
