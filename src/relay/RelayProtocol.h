#ifndef RELAY_PROTOCOL_H
#define RELAY_PROTOCOL_H

#include <math.h>
#include <stddef.h>
#include <stdint.h>

enum class RelayFrameType : uint8_t {
    BEACON = 1,
    FORWARD_REQUEST = 2,
    CAPSULE = 3,
    RELAY_START = 4
};

struct Beacon {
    uint8_t relayId;
    bool uplinkOk;
    int8_t rssi;

    Beacon(uint8_t id = 0, bool ok = false, int8_t signal = 0)
        : relayId(id), uplinkOk(ok), rssi(signal) {}
};

// Compact health snapshot a stranded or relayed node hands to a sibling.
struct Capsule {
    uint8_t sourceId;
    uint16_t seq;
    uint16_t bpm;
    float rmssdMs;        // NAN = unavailable
    float sdnnMs;         // NAN = unavailable
    uint16_t gasRaw;
    float temperatureC;   // NAN = unavailable
    int8_t rssi;
    bool uplinkOk;
    bool bleOk;
    bool ecgOn;

    Capsule()
        : sourceId(0), seq(0), bpm(0), rmssdMs(NAN), sdnnMs(NAN), gasRaw(0),
          temperatureC(NAN), rssi(0), uplinkOk(false), bleOk(false), ecgOn(false) {}
};

/**
 * Relay link frames: version, type, payload length, payload.
 * Multi-byte fields are little-endian. A frame is accepted only if its
 * version is known and its length matches its type exactly.
 */
class RelayProtocol {
public:
    static constexpr uint8_t VERSION = 1;
    static constexpr size_t HEADER_BYTES = 3;
    static constexpr size_t BEACON_PAYLOAD = 3;
    static constexpr size_t ID_PAYLOAD = 1;
    static constexpr size_t CAPSULE_PAYLOAD = 17;
    static constexpr size_t MAX_FRAME_BYTES = HEADER_BYTES + CAPSULE_PAYLOAD;

    static constexpr uint16_t METRIC_NONE = 0xFFFF;
    static constexpr int16_t TEMPERATURE_NONE = INT16_MIN;

    static size_t encodeBeacon(const Beacon& beacon, uint8_t* out, size_t size);
    static size_t encodeForwardRequest(uint8_t fromId, uint8_t* out, size_t size);
    static size_t encodeRelayStart(uint8_t fromId, uint8_t* out, size_t size);
    static size_t encodeCapsule(const Capsule& capsule, uint8_t* out, size_t size);

    // Validates the header; on success payload points into data.
    static bool readHeader(const uint8_t* data, size_t length, RelayFrameType& type,
                           const uint8_t*& payload, size_t& payloadLength);

    static bool decodeBeacon(const uint8_t* payload, size_t length, Beacon& beacon);
    static bool decodeId(const uint8_t* payload, size_t length, uint8_t& id);
    static bool decodeCapsule(const uint8_t* payload, size_t length, Capsule& capsule);

    static const char* typeName(RelayFrameType type);

private:
    static size_t expectedPayload(uint8_t type);
    static size_t writeHeader(RelayFrameType type, size_t payloadLength, uint8_t* out, size_t size);
    static uint16_t encodeTenths(float value);
    static float decodeTenths(uint16_t value);
};

#endif
