#ifndef TELEMETRY_SERIALIZER_H
#define TELEMETRY_SERIALIZER_H

#include <math.h>
#include <stddef.h>
#include <stdint.h>

// Identity and routing stamped on every Environment/Biomedical record.
struct MessageTags {
    const char* teamId;
    const char* ffId;
    const char* nodeId;
    const char* originNodeId;
    const char* via;           // "wifi" or "relay"
    bool failover;
    int forwardHopCount;
    const char* source;
    const char* observedAt;    // null until wall-clock is synchronized

    MessageTags()
        : teamId(""), ffId(""), nodeId(""), originNodeId(""), via("wifi"), failover(false),
          forwardHopCount(0), source(""), observedAt(nullptr) {}
};

struct EnvironmentRecord {
    MessageTags tags;
    float tempC;
    float humidityPct;
    int gasRaw;
    int gasDigital;
    float coPpm;
    int radioRssiDbm;

    EnvironmentRecord()
        : tempC(NAN), humidityPct(NAN), gasRaw(-1), gasDigital(-1), coPpm(NAN), radioRssiDbm(0) {}
};

struct BiomedicalRecord {
    MessageTags tags;
    float hrBpm;
    float rrMs;
    float rmssdMs;
    float sdnnMs;
    float pnn50Pct;
    bool wearableOk;

    BiomedicalRecord()
        : hrBpm(NAN), rrMs(NAN), rmssdMs(NAN), sdnnMs(NAN), pnn50Pct(NAN), wearableOk(false) {}
};

struct GatewayHealthRecord {
    const char* nodeId;
    const char* observedAt;
    bool uplinkReal;
    bool uplinkEffective;
    int radioRssiDbm;
    bool bleOk;
    bool ecgOn;
    uint32_t ecgPacketsTotal;
    uint32_t ecgDropTotal;
    const char* mode;
    uint32_t relayPeers;
    uint32_t capsulesForwarded;

    GatewayHealthRecord()
        : nodeId(""), observedAt(nullptr), uplinkReal(false), uplinkEffective(false),
          radioRssiDbm(0), bleOk(false), ecgOn(false), ecgPacketsTotal(0), ecgDropTotal(0),
          mode("DIRECT"), relayPeers(0), capsulesForwarded(0) {}
};

class TelemetrySerializer {
public:
    static constexpr size_t MAX_JSON_BYTES = 512;
    static constexpr size_t MAX_TOPIC_BYTES = 96;

    // Each returns the JSON length, or 0 if it did not fit.
    static size_t environment(const EnvironmentRecord& record, char* out, size_t size);
    static size_t biomedical(const BiomedicalRecord& record, char* out, size_t size);
    static size_t gatewayHealth(const GatewayHealthRecord& record, char* out, size_t size);

    // <prefix>/<category>/<first>[/<second>]; category may be null for the ECG topic.
    static size_t topic(char* out, size_t size, const char* prefix, const char* category,
                        const char* first, const char* second);
};

#endif
