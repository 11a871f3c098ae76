#ifndef FFNODE_TEST_FAKES_H
#define FFNODE_TEST_FAKES_H

#include <stdio.h>
#include <string.h>
#include <deque>
#include <string>
#include <vector>

#include "Config.h"
#include "IClock.h"
#include "IEnvironmentSensor.h"
#include "ILogger.h"
#include "IRelayRadio.h"
#include "IUplinkTransport.h"
#include "IWearableTransport.h"

typedef std::vector<uint8_t> Bytes;

class FakeClock : public IClock {
public:
    uint32_t now;
    bool synced;

    FakeClock() : now(0), synced(false) {}

    uint32_t monotonicMs() const override { return now; }

    bool utcTimestamp(char* buffer, size_t length) const override {
        if (!synced) return false;
        snprintf(buffer, length, "2024-05-01T12:00:00Z");
        return true;
    }
};

class RecordingLogger : public ILogger {
public:
    struct Line {
        LogLevel level;
        std::string text;
    };

    std::vector<Line> lines;
    LogLevel level;

    RecordingLogger() : level(LogLevel::DEBUG) {}

    void log(LogLevel lineLevel, const char* message) override {
        if (!isEnabled(lineLevel)) return;
        Line line;
        line.level = lineLevel;
        line.text = message ? message : "";
        lines.push_back(line);
    }

    void logf(LogLevel lineLevel, const char* format, ...) override {
        va_list args;
        va_start(args, format);
        vlogf(lineLevel, format, args);
        va_end(args);
    }

    void setLogLevel(LogLevel newLevel) override { level = newLevel; }
    LogLevel getLogLevel() const override { return level; }

    bool contains(const char* fragment) const {
        for (size_t i = 0; i < lines.size(); i++) {
            if (lines[i].text.find(fragment) != std::string::npos) return true;
        }
        return false;
    }

    size_t count(LogLevel lineLevel) const {
        size_t n = 0;
        for (size_t i = 0; i < lines.size(); i++) {
            if (lines[i].level == lineLevel) n++;
        }
        return n;
    }
};

class FakeUplinkTransport : public IUplinkTransport {
public:
    struct Message {
        std::string topic;
        Bytes payload;

        std::string text() const { return std::string(payload.begin(), payload.end()); }
    };

    bool initializeResult;
    bool associated;
    bool sessionReady;
    bool connectResult;
    bool publishResult;
    int8_t signal;

    std::vector<std::string> associationSsids;
    std::vector<Message> published;
    int sessionConnects;
    int timeSyncs;
    int loops;

    FakeUplinkTransport()
        : initializeResult(true), associated(false), sessionReady(false), connectResult(true),
          publishResult(true), signal(-60), sessionConnects(0), timeSyncs(0), loops(0) {}

    bool initialize(const Config*) override { return initializeResult; }

    bool beginAssociation(const WiFiCredential& credential) override {
        associationSsids.push_back(credential.ssid);
        return true;
    }

    bool isAssociated() override { return associated; }
    int8_t rssi() override { return signal; }

    bool connectSession() override {
        sessionConnects++;
        if (connectResult) sessionReady = true;
        return connectResult;
    }

    bool isSessionReady() override { return sessionReady; }

    bool publish(const char* topic, const uint8_t* payload, size_t length) override {
        if (!publishResult) return false;
        Message message;
        message.topic = topic;
        message.payload.assign(payload, payload + length);
        published.push_back(message);
        return true;
    }

    void requestTimeSync() override { timeSyncs++; }
    void loop() override { loops++; }

    // Association and session both up.
    void bringUp() {
        associated = true;
        sessionReady = true;
    }

    size_t countTopic(const std::string& topic) const {
        size_t n = 0;
        for (size_t i = 0; i < published.size(); i++) {
            if (published[i].topic == topic) n++;
        }
        return n;
    }

    const Message* lastOn(const std::string& topic) const {
        for (size_t i = published.size(); i > 0; i--) {
            if (published[i - 1].topic == topic) return &published[i - 1];
        }
        return nullptr;
    }
};

class FakeRelayRadio : public IRelayRadio {
public:
    struct Frame {
        Bytes mac;
        Bytes data;
    };

    bool beginResult;
    bool sendResult;
    uint8_t channel;
    std::vector<Bytes> peers;
    std::vector<Frame> sent;
    IRelayFrameSink* sink;

    FakeRelayRadio() : beginResult(true), sendResult(true), channel(0), sink(nullptr) {}

    bool begin(uint8_t ch) override {
        channel = ch;
        return beginResult;
    }

    bool addPeer(const uint8_t* mac) override {
        peers.push_back(Bytes(mac, mac + MAC_LENGTH));
        return true;
    }

    bool send(const uint8_t* mac, const uint8_t* data, size_t length) override {
        if (!sendResult) return false;
        Frame frame;
        frame.mac.assign(mac, mac + MAC_LENGTH);
        frame.data.assign(data, data + length);
        sent.push_back(frame);
        return true;
    }

    void setReceiver(IRelayFrameSink* receiver) override { sink = receiver; }

    void deliver(const uint8_t* mac, const Bytes& data) {
        if (sink) sink->onRelayFrame(mac, data.data(), data.size());
    }

    // Frames of one type (second header byte) sent so far.
    std::vector<Frame> sentOfType(uint8_t type) const {
        std::vector<Frame> frames;
        for (size_t i = 0; i < sent.size(); i++) {
            if (sent[i].data.size() > 1 && sent[i].data[1] == type) frames.push_back(sent[i]);
        }
        return frames;
    }
};

class FakeWearableTransport : public IWearableTransport {
public:
    bool initializeResult;
    bool deviceNearby;
    bool connectResult;
    bool connected;
    bool heartRateSubscribeResult;
    bool pmdPresent;
    bool pmdControlResult;
    bool pmdDataResult;
    bool writeResult;
    uint16_t mtu;

    int scans;
    int connects;
    std::vector<Bytes> controlWrites;

    // Answers to control writes, consumed in order. Answered synchronously,
    // the way an indication can arrive before the write call returns.
    std::deque<Bytes> controlResponses;

    IWearableEventSink* sink;

    FakeWearableTransport()
        : initializeResult(true), deviceNearby(true), connectResult(true), connected(false),
          heartRateSubscribeResult(true), pmdPresent(true), pmdControlResult(true),
          pmdDataResult(true), writeResult(true), mtu(232), scans(0), connects(0), sink(nullptr) {}

    bool initialize() override { return initializeResult; }
    void setEventSink(IWearableEventSink* eventSink) override { sink = eventSink; }

    bool scanForDevice(const char*, uint32_t) override {
        scans++;
        return deviceNearby;
    }

    bool connect() override {
        connects++;
        connected = connectResult;
        return connectResult;
    }

    void disconnect() override { connected = false; }
    bool isConnected() override { return connected; }
    uint16_t negotiateMtu(uint16_t desired) override { return desired < mtu ? desired : mtu; }
    const char* peerName() const override { return "Polar H10 1234ABCD"; }

    bool subscribeHeartRate() override { return heartRateSubscribeResult; }
    bool hasPmdService() override { return pmdPresent; }
    bool subscribePmdControl() override { return pmdControlResult; }
    bool subscribePmdData() override { return pmdDataResult; }

    bool writePmdControl(const uint8_t* data, size_t length) override {
        controlWrites.push_back(Bytes(data, data + length));
        if (!writeResult) return false;
        if (!controlResponses.empty()) {
            Bytes response = controlResponses.front();
            controlResponses.pop_front();
            if (sink) sink->onPmdControlResponse(response.data(), response.size());
        }
        return true;
    }

    void notifyHeartRate(const Bytes& data) {
        if (sink) sink->onHeartRateNotification(data.data(), data.size());
    }

    // Control point indication arriving on its own, after the write returned.
    void indicate(const Bytes& data) {
        if (sink) sink->onPmdControlResponse(data.data(), data.size());
    }

    void notifyPmdData(const Bytes& data) {
        if (sink) sink->onPmdData(data.data(), data.size());
    }

    void dropLink() {
        connected = false;
        if (sink) sink->onWearableDisconnected();
    }
};

class FakeEnvironmentSensor : public IEnvironmentSensor {
public:
    EnvironmentReading reading;
    bool ready;
    int reads;

    FakeEnvironmentSensor() : ready(true), reads(0) {
        reading.tempC = 24.5f;
        reading.gasRaw = 812;
        reading.gasDigital = 0;
        reading.status = SensorStatus::OK;
    }

    bool initialize() override { return ready; }

    EnvironmentReading read() override {
        reads++;
        return reading;
    }

    bool isReady() const override { return ready; }
    const char* getName() const override { return "FakeEnvironment"; }
};

// Node A of team Team_A, with node B and node C as relay siblings.
inline Config makeTestConfig() {
    Config config;
    config.identity = NodeIdentity("Team_A", "FF_A", "node-A", 1);

    config.wifi = WiFiConfig(10000, 5000);
    config.wifi.addCredential("alpha", "pw-alpha");
    config.wifi.addCredential("bravo", "pw-bravo");
    config.wifi.addCredential("charlie", "pw-charlie");

    config.mqtt = MqttConfig("broker.local", 1883);

    config.relay = RelayConfig(6, 1000, 4000, 2000);
    const uint8_t macB[MAC_LENGTH] = { 0x24, 0x6F, 0x28, 0x00, 0x00, 0x02 };
    const uint8_t macC[MAC_LENGTH] = { 0x24, 0x6F, 0x28, 0x00, 0x00, 0x03 };
    config.relay.addSibling(macB, 2, "node-B", "Team_A", "FF_B");
    config.relay.addSibling(macC, 3, "node-C", "Team_B", "FF_C");

    config.failover = FailoverConfig(8000, 15000);
    config.wearable = WearableConfig("Polar H10");
    config.ecg = EcgConfig();
    config.hrv = HrvConfig();
    config.publish = PublishConfig(1000, 2000, 5000);
    config.pins = PinConfig();
    return config;
}

// Heart rate notification: 8-bit BPM with RR fields in 1/1024 s ticks.
inline Bytes heartRatePacket(uint8_t bpm, const std::vector<uint16_t>& rrTicks) {
    Bytes packet;
    packet.push_back(rrTicks.empty() ? 0x00 : 0x10);
    packet.push_back(bpm);
    for (size_t i = 0; i < rrTicks.size(); i++) {
        packet.push_back((uint8_t)(rrTicks[i] & 0xFF));
        packet.push_back((uint8_t)(rrTicks[i] >> 8));
    }
    return packet;
}

// Raw ECG notification carrying the given microvolt samples.
inline Bytes ecgPacket(const std::vector<int32_t>& samples) {
    Bytes packet(10, 0);
    for (size_t i = 0; i < samples.size(); i++) {
        uint32_t raw = (uint32_t)samples[i];
        packet.push_back((uint8_t)(raw & 0xFF));
        packet.push_back((uint8_t)((raw >> 8) & 0xFF));
        packet.push_back((uint8_t)((raw >> 16) & 0xFF));
    }
    return packet;
}

#endif
