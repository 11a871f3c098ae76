#include "TelemetrySerializer.h"
#include <stdio.h>
#include "JsonBuffer.h"

constexpr size_t TelemetrySerializer::MAX_JSON_BYTES;
constexpr size_t TelemetrySerializer::MAX_TOPIC_BYTES;

static void writeTags(JsonBuffer& json, const MessageTags& tags, bool withNodeId) {
    json.string("teamId", tags.teamId);
    json.string("ffId", tags.ffId);
    if (withNodeId) json.string("nodeId", tags.nodeId);
    json.string("originNodeId", tags.originNodeId);
    json.string("via", tags.via);
    json.boolean("failover", tags.failover);
    json.integer("forwardHopCount", tags.forwardHopCount);
    json.string("observedAt", tags.observedAt);
}

size_t TelemetrySerializer::environment(const EnvironmentRecord& record, char* out, size_t size) {
    JsonBuffer json(out, size);
    writeTags(json, record.tags, true);
    json.number("tempC", record.tempC, 2);
    json.number("humidityPct", record.humidityPct, 1);
    if (record.gasRaw >= 0) json.integer("gasRawADC", record.gasRaw);
    else json.null("gasRawADC");
    if (record.gasDigital >= 0) json.integer("gasDigital", record.gasDigital);
    else json.null("gasDigital");
    json.number("coPpm", record.coPpm, 1);
    json.integer("radioRssiDbm", record.radioRssiDbm);
    json.string("source", record.tags.source);
    return json.finish();
}

size_t TelemetrySerializer::biomedical(const BiomedicalRecord& record, char* out, size_t size) {
    JsonBuffer json(out, size);
    writeTags(json, record.tags, false);
    json.number("hrBpm", record.hrBpm, 0);
    json.number("rrMs", record.rrMs, 1);
    json.number("rmssdMs", record.rmssdMs, 1);
    json.number("sdnnMs", record.sdnnMs, 1);
    json.number("pnn50Pct", record.pnn50Pct, 1);
    json.boolean("wearableOk", record.wearableOk);
    json.string("source", record.tags.source);
    return json.finish();
}

size_t TelemetrySerializer::gatewayHealth(const GatewayHealthRecord& record, char* out, size_t size) {
    JsonBuffer json(out, size);
    json.string("nodeId", record.nodeId);
    json.string("observedAt", record.observedAt);
    json.boolean("uplinkReal", record.uplinkReal);
    json.boolean("uplinkEffective", record.uplinkEffective);
    json.integer("radioRssiDbm", record.radioRssiDbm);
    json.boolean("bleOk", record.bleOk);
    json.boolean("ecgOn", record.ecgOn);
    json.integer("ecgPacketsTotal", (long)record.ecgPacketsTotal);
    json.integer("ecgDropTotal", (long)record.ecgDropTotal);
    json.string("mode", record.mode);
    json.integer("relayPeers", (long)record.relayPeers);
    json.integer("capsulesForwarded", (long)record.capsulesForwarded);
    return json.finish();
}

size_t TelemetrySerializer::topic(char* out, size_t size, const char* prefix, const char* category,
                                  const char* first, const char* second) {
    if (!out || size == 0) return 0;

    int n;
    if (category && second) {
        n = snprintf(out, size, "%s/%s/%s/%s", prefix, category, first, second);
    } else if (category) {
        n = snprintf(out, size, "%s/%s/%s", prefix, category, first);
    } else if (second) {
        n = snprintf(out, size, "%s/%s/%s", prefix, first, second);
    } else {
        n = snprintf(out, size, "%s/%s", prefix, first);
    }

    if (n < 0 || (size_t)n >= size) return 0;
    return (size_t)n;
}
