#include <gtest/gtest.h>
#include <math.h>
#include <string>
#include "telemetry/JsonBuffer.h"
#include "telemetry/TelemetrySerializer.h"

namespace {

MessageTags ownTags() {
    MessageTags tags;
    tags.teamId = "Team_A";
    tags.ffId = "FF_A";
    tags.nodeId = "node-A";
    tags.originNodeId = "node-A";
    tags.source = "ffnode";
    tags.observedAt = "2024-05-01T12:00:00Z";
    return tags;
}

}  // namespace

TEST(TelemetrySerializerTest, BiomedicalRecord) {
    BiomedicalRecord record;
    record.tags = ownTags();
    record.hrBpm = 72.0f;
    record.rrMs = 812.5f;
    record.sdnnMs = 41.3f;
    record.pnn50Pct = 12.5f;
    record.wearableOk = true;

    char json[TelemetrySerializer::MAX_JSON_BYTES];
    size_t length = TelemetrySerializer::biomedical(record, json, sizeof(json));

    EXPECT_EQ(std::string("{\"teamId\":\"Team_A\",\"ffId\":\"FF_A\",\"originNodeId\":\"node-A\","
                          "\"via\":\"wifi\",\"failover\":false,\"forwardHopCount\":0,"
                          "\"observedAt\":\"2024-05-01T12:00:00Z\",\"hrBpm\":72,\"rrMs\":812.5,"
                          "\"rmssdMs\":null,\"sdnnMs\":41.3,\"pnn50Pct\":12.5,\"wearableOk\":true,"
                          "\"source\":\"ffnode\"}"),
              std::string(json, length));
}

TEST(TelemetrySerializerTest, EnvironmentWritesNullForMissingReadings) {
    EnvironmentRecord record;
    record.tags = ownTags();
    record.tags.observedAt = nullptr;
    record.tempC = 31.256f;
    record.radioRssiDbm = -61;

    char json[TelemetrySerializer::MAX_JSON_BYTES];
    size_t length = TelemetrySerializer::environment(record, json, sizeof(json));
    ASSERT_GT(length, 0u);
    std::string text(json, length);

    EXPECT_NE(std::string::npos, text.find("\"nodeId\":\"node-A\""));
    EXPECT_NE(std::string::npos, text.find("\"observedAt\":null"));
    EXPECT_NE(std::string::npos, text.find("\"tempC\":31.26"));
    EXPECT_NE(std::string::npos, text.find("\"humidityPct\":null"));
    EXPECT_NE(std::string::npos, text.find("\"gasRawADC\":null"));
    EXPECT_NE(std::string::npos, text.find("\"gasDigital\":null"));
    EXPECT_NE(std::string::npos, text.find("\"coPpm\":null"));
    EXPECT_NE(std::string::npos, text.find("\"radioRssiDbm\":-61"));
    EXPECT_EQ('}', text[text.size() - 1]);
}

TEST(TelemetrySerializerTest, RelayedTagsAreWritten) {
    EnvironmentRecord record;
    record.tags = ownTags();
    record.tags.originNodeId = "node-C";
    record.tags.via = "relay";
    record.tags.failover = true;
    record.tags.forwardHopCount = 1;
    record.gasRaw = 0;

    char json[TelemetrySerializer::MAX_JSON_BYTES];
    size_t length = TelemetrySerializer::environment(record, json, sizeof(json));
    std::string text(json, length);

    EXPECT_NE(std::string::npos, text.find("\"originNodeId\":\"node-C\",\"via\":\"relay\","
                                           "\"failover\":true,\"forwardHopCount\":1"));
    EXPECT_NE(std::string::npos, text.find("\"gasRawADC\":0"));
}

TEST(TelemetrySerializerTest, GatewayHealthRecord) {
    GatewayHealthRecord record;
    record.nodeId = "node-B";
    record.uplinkReal = true;
    record.uplinkEffective = false;
    record.radioRssiDbm = -58;
    record.ecgPacketsTotal = 4000000000u;
    record.mode = "RELAYED";
    record.relayPeers = 2;

    char json[TelemetrySerializer::MAX_JSON_BYTES];
    size_t length = TelemetrySerializer::gatewayHealth(record, json, sizeof(json));
    std::string text(json, length);

    EXPECT_EQ(0u, text.find("{\"nodeId\":\"node-B\",\"observedAt\":null,\"uplinkReal\":true,"
                            "\"uplinkEffective\":false"));
    EXPECT_NE(std::string::npos, text.find("\"ecgPacketsTotal\":4000000000"));
    EXPECT_NE(std::string::npos, text.find("\"mode\":\"RELAYED\""));
    EXPECT_NE(std::string::npos, text.find("\"relayPeers\":2"));
}

TEST(TelemetrySerializerTest, TooSmallBufferYieldsZero) {
    BiomedicalRecord record;
    record.tags = ownTags();

    char json[64];
    EXPECT_EQ(0u, TelemetrySerializer::biomedical(record, json, sizeof(json)));
}

TEST(TelemetrySerializerTest, Topics) {
    char topic[TelemetrySerializer::MAX_TOPIC_BYTES];

    TelemetrySerializer::topic(topic, sizeof(topic), "ngsi", "Biomedical", "Team_A", "FF_A");
    EXPECT_STREQ("ngsi/Biomedical/Team_A/FF_A", topic);

    TelemetrySerializer::topic(topic, sizeof(topic), "ngsi", "Gateway", "node-A", nullptr);
    EXPECT_STREQ("ngsi/Gateway/node-A", topic);

    TelemetrySerializer::topic(topic, sizeof(topic), "raw/ECG", nullptr, "Team_A", "FF_A");
    EXPECT_STREQ("raw/ECG/Team_A/FF_A", topic);

    char tiny[8];
    EXPECT_EQ(0u, TelemetrySerializer::topic(tiny, sizeof(tiny), "ngsi", "Gateway", "node-A",
                                             nullptr));
}

TEST(JsonBufferTest, NonFiniteNumbersAndNullStrings) {
    char out[128];
    JsonBuffer json(out, sizeof(out));
    json.number("a", NAN, 1);
    json.number("b", INFINITY, 1);
    json.string("c", nullptr);
    json.integer("d", -3);
    size_t length = json.finish();

    EXPECT_EQ(std::string("{\"a\":null,\"b\":null,\"c\":null,\"d\":-3}"), std::string(out, length));
}

TEST(JsonBufferTest, StringValuesAreEscaped) {
    char out[128];
    JsonBuffer json(out, sizeof(out));
    json.string("q", "say \"hi\"");
    json.string("p", "C:\\nodes");
    json.string("c", "a\nb\x01");
    size_t length = json.finish();

    EXPECT_EQ(std::string("{\"q\":\"say \\\"hi\\\"\",\"p\":\"C:\\\\nodes\",\"c\":\"a\\nb\\u0001\"}"),
              std::string(out, length));
}

TEST(JsonBufferTest, EscapingCountsTowardsCapacity) {
    char out[12];
    JsonBuffer json(out, sizeof(out));
    json.string("k", "\"\"\"\"");    // 8 bytes once escaped

    EXPECT_EQ(0u, json.finish());
}

TEST(TelemetrySerializerTest, QuoteInWearerIdKeepsJsonValid) {
    EnvironmentRecord record;
    record.tags = ownTags();
    record.tags.ffId = "FF \"A\"";

    char out[TelemetrySerializer::MAX_JSON_BYTES];
    size_t length = TelemetrySerializer::environment(record, out, sizeof(out));
    ASSERT_GT(length, 0u);

    std::string json(out, length);
    EXPECT_NE(std::string::npos, json.find("\"ffId\":\"FF \\\"A\\\"\""));
}
