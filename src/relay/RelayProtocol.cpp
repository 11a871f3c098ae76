#include "RelayProtocol.h"

constexpr uint8_t RelayProtocol::VERSION;
constexpr size_t RelayProtocol::HEADER_BYTES;
constexpr size_t RelayProtocol::BEACON_PAYLOAD;
constexpr size_t RelayProtocol::ID_PAYLOAD;
constexpr size_t RelayProtocol::CAPSULE_PAYLOAD;
constexpr size_t RelayProtocol::MAX_FRAME_BYTES;
constexpr uint16_t RelayProtocol::METRIC_NONE;
constexpr int16_t RelayProtocol::TEMPERATURE_NONE;

static void putU16(uint8_t* p, uint16_t value) {
    p[0] = (uint8_t)(value & 0xFF);
    p[1] = (uint8_t)(value >> 8);
}

static uint16_t getU16(const uint8_t* p) {
    return (uint16_t)(p[0] | (p[1] << 8));
}

size_t RelayProtocol::expectedPayload(uint8_t type) {
    switch (type) {
        case (uint8_t)RelayFrameType::BEACON: return BEACON_PAYLOAD;
        case (uint8_t)RelayFrameType::FORWARD_REQUEST: return ID_PAYLOAD;
        case (uint8_t)RelayFrameType::CAPSULE: return CAPSULE_PAYLOAD;
        case (uint8_t)RelayFrameType::RELAY_START: return ID_PAYLOAD;
        default: return 0;
    }
}

size_t RelayProtocol::writeHeader(RelayFrameType type, size_t payloadLength, uint8_t* out,
                                  size_t size) {
    if (!out || size < HEADER_BYTES + payloadLength) return 0;
    out[0] = VERSION;
    out[1] = (uint8_t)type;
    out[2] = (uint8_t)payloadLength;
    return HEADER_BYTES;
}

uint16_t RelayProtocol::encodeTenths(float value) {
    if (isnan(value) || value < 0.0f) return METRIC_NONE;
    float tenths = value * 10.0f + 0.5f;
    if (tenths >= (float)(METRIC_NONE - 1)) return METRIC_NONE - 1;
    return (uint16_t)tenths;
}

float RelayProtocol::decodeTenths(uint16_t value) {
    return value == METRIC_NONE ? NAN : value / 10.0f;
}

size_t RelayProtocol::encodeBeacon(const Beacon& beacon, uint8_t* out, size_t size) {
    size_t offset = writeHeader(RelayFrameType::BEACON, BEACON_PAYLOAD, out, size);
    if (offset == 0) return 0;
    out[offset++] = beacon.relayId;
    out[offset++] = beacon.uplinkOk ? 1 : 0;
    out[offset++] = (uint8_t)beacon.rssi;
    return offset;
}

size_t RelayProtocol::encodeForwardRequest(uint8_t fromId, uint8_t* out, size_t size) {
    size_t offset = writeHeader(RelayFrameType::FORWARD_REQUEST, ID_PAYLOAD, out, size);
    if (offset == 0) return 0;
    out[offset++] = fromId;
    return offset;
}

size_t RelayProtocol::encodeRelayStart(uint8_t fromId, uint8_t* out, size_t size) {
    size_t offset = writeHeader(RelayFrameType::RELAY_START, ID_PAYLOAD, out, size);
    if (offset == 0) return 0;
    out[offset++] = fromId;
    return offset;
}

size_t RelayProtocol::encodeCapsule(const Capsule& capsule, uint8_t* out, size_t size) {
    size_t offset = writeHeader(RelayFrameType::CAPSULE, CAPSULE_PAYLOAD, out, size);
    if (offset == 0) return 0;

    int16_t temperature = TEMPERATURE_NONE;
    if (!isnan(capsule.temperatureC)) {
        float hundredths = capsule.temperatureC * 100.0f;
        if (hundredths > 32767.0f) hundredths = 32767.0f;
        if (hundredths < -32767.0f) hundredths = -32767.0f;
        temperature = (int16_t)lroundf(hundredths);
    }

    out[offset++] = capsule.sourceId;
    putU16(&out[offset], capsule.seq); offset += 2;
    putU16(&out[offset], capsule.bpm); offset += 2;
    putU16(&out[offset], encodeTenths(capsule.rmssdMs)); offset += 2;
    putU16(&out[offset], encodeTenths(capsule.sdnnMs)); offset += 2;
    putU16(&out[offset], capsule.gasRaw); offset += 2;
    putU16(&out[offset], (uint16_t)temperature); offset += 2;
    out[offset++] = (uint8_t)capsule.rssi;
    out[offset++] = capsule.uplinkOk ? 1 : 0;
    out[offset++] = capsule.bleOk ? 1 : 0;
    out[offset++] = capsule.ecgOn ? 1 : 0;
    return offset;
}

bool RelayProtocol::readHeader(const uint8_t* data, size_t length, RelayFrameType& type,
                               const uint8_t*& payload, size_t& payloadLength) {
    if (!data || length < HEADER_BYTES) return false;
    if (data[0] != VERSION) return false;

    size_t expected = expectedPayload(data[1]);
    if (expected == 0) return false;
    if (data[2] != expected || length != HEADER_BYTES + expected) return false;

    type = (RelayFrameType)data[1];
    payload = &data[HEADER_BYTES];
    payloadLength = expected;
    return true;
}

bool RelayProtocol::decodeBeacon(const uint8_t* payload, size_t length, Beacon& beacon) {
    if (!payload || length != BEACON_PAYLOAD) return false;
    beacon.relayId = payload[0];
    beacon.uplinkOk = payload[1] != 0;
    beacon.rssi = (int8_t)payload[2];
    return true;
}

bool RelayProtocol::decodeId(const uint8_t* payload, size_t length, uint8_t& id) {
    if (!payload || length != ID_PAYLOAD) return false;
    id = payload[0];
    return true;
}

bool RelayProtocol::decodeCapsule(const uint8_t* payload, size_t length, Capsule& capsule) {
    if (!payload || length != CAPSULE_PAYLOAD) return false;

    const uint8_t* p = payload;
    capsule.sourceId = p[0];
    capsule.seq = getU16(&p[1]);
    capsule.bpm = getU16(&p[3]);
    capsule.rmssdMs = decodeTenths(getU16(&p[5]));
    capsule.sdnnMs = decodeTenths(getU16(&p[7]));
    capsule.gasRaw = getU16(&p[9]);
    int16_t temperature = (int16_t)getU16(&p[11]);
    capsule.temperatureC = temperature == TEMPERATURE_NONE ? NAN : temperature / 100.0f;
    capsule.rssi = (int8_t)p[13];
    capsule.uplinkOk = p[14] != 0;
    capsule.bleOk = p[15] != 0;
    capsule.ecgOn = p[16] != 0;
    return true;
}

const char* RelayProtocol::typeName(RelayFrameType type) {
    switch (type) {
        case RelayFrameType::BEACON: return "BEACON";
        case RelayFrameType::FORWARD_REQUEST: return "FORWARD_REQUEST";
        case RelayFrameType::CAPSULE: return "CAPSULE";
        case RelayFrameType::RELAY_START: return "RELAY_START";
    }
    return "UNKNOWN";
}
