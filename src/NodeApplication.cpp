#include "NodeApplication.h"
#include <string.h>

constexpr uint32_t NodeApplication::STATUS_INTERVAL_MS;

NodeApplication::NodeApplication()
    : config(loadConfig()), logger(LogLevel::INFO, true), ui(true),
      uplinkTransport(&logger), relayRadio(&logger), wearableTransport(&logger),
      environmentSensor(&logger, &config),
      uplink(&logger, &config, &uplinkTransport),
      relayLink(&logger, &config, &relayRadio),
      failover(&logger, &config, &uplink, &relayLink),
      pipeline(&logger, &config),
      wearable(&logger, &config, &wearableTransport, pipeline.getQueue()),
      publisher(&logger, &config, &clock, &uplink, &relayLink, &failover, &wearable, &pipeline,
                &environmentSensor),
      currentState(ApplicationState::INITIALIZING), ecgEnabled(true), lastStatusAt(0),
      consoleLength(0), ledMode(LED_OFF), lastLedToggle(0), ledState(false) {
    consoleLine[0] = '\0';
}

Config NodeApplication::loadConfig() {
    Config loaded;
    loaded.loadFromDefaults();
    return loaded;
}

bool NodeApplication::initialize() {
    currentState = ApplicationState::INITIALIZING;

    Serial.begin(115200);
    while (!Serial && millis() < 3000) {
        delay(10);
    }

    logger.info("=== FFNODE firefighter field node ===");

    if (!config.validate(&logger)) {
        logger.critical("Configuration validation failed");
        currentState = ApplicationState::ERROR;
        return false;
    }
    config.print(&logger);

    pinMode(config.pins.ledPin, OUTPUT);
    digitalWrite(config.pins.ledPin, HIGH);
    setLED(LED_FAST);

    printBootInfo();

    environmentSensor.initialize();

    // Station mode first; the relay radio pins the channel afterwards.
    if (!uplink.initialize()) {
        logger.error("Uplink unavailable, relay only");
    }
    if (!relayLink.initialize()) {
        logger.error("Relay link unavailable, direct only");
    }
    if (!wearable.initialize()) {
        logger.error("Wearable client unavailable");
    }

    wearable.setHeartSampleConsumer(&pipeline);
    relayLink.setCapsuleSource(&publisher);
    relayLink.setCapsuleSink(&publisher);

    lastStatusAt = clock.monotonicMs();
    currentState = ApplicationState::RUNNING;
    setLED(LED_SLOW);

    logger.info("Node initialized");
    return true;
}

void NodeApplication::printBootInfo() {
    ui.cardHeader("BOOT", "EVENT");
    ui.cardKVf("heap", "%u B", (unsigned)ESP.getFreeHeap());
    ui.cardKVf("chip", "%s rev %d", ESP.getChipModel(), (int)ESP.getChipRevision());
    ui.cardKV("node", config.identity.nodeId);
    ui.cardKVf("wearer", "%s / %s", config.identity.teamId, config.identity.wearerId);
    ui.cardKVf("relay id", "%u (ch %u, %u siblings)", (unsigned)config.identity.relayId,
               (unsigned)config.relay.channel, (unsigned)config.relay.siblingCount);
    ui.cardFooter();
}

void NodeApplication::updateEcgPolicy() {
    bool desired = ecgEnabled && (!config.wearable.ecgOnlyWhenDirect || failover.isDirect());
    wearable.setEcgDesired(desired);
}

void NodeApplication::loop() {
    uint32_t now = clock.monotonicMs();
    updateLED(now);

    if (currentState == ApplicationState::ERROR) {
        setLED(LED_ERROR);
        delay(1000);
        return;
    }

    pollConsole();

    uplink.tick(now);
    relayLink.tick(now, failover.isDirect(), uplink.isEffective(), uplink.getRssi());

    FailoverTransition transition = failover.tick(now);
    if (transition.changed) {
        const RelaySibling* relay = failover.getCurrentRelay();
        ui.printModeTransition(failoverStateName(transition.from), failoverStateName(transition.to),
                               relay ? relay->nodeId : nullptr);
        setLED(failover.isDirect() ? LED_SLOW : LED_FAST);
    }

    updateEcgPolicy();
    wearable.tick(clock.monotonicMs());

    pipeline.setEcgActive(wearable.isEcgStreaming());
    pipeline.setSampleRate(wearable.getReportedSampleRate());

    publisher.tick(clock.monotonicMs());

    if (elapsedSince(now, lastStatusAt, STATUS_INTERVAL_MS)) {
        printStatus(now);
    }
}

void NodeApplication::printStatus(uint32_t now) {
    lastStatusAt = now;

    PipelineCounters ecg = pipeline.getCounters();
    const PublishCounters& sent = publisher.getCounters();

    ui.cardHeader("STATUS", "EVENT");
    ui.cardKVf("uptime", "%lu s", (unsigned long)(now / 1000));
    ui.cardKVf("heap", "%u B", (unsigned)ESP.getFreeHeap());
    ui.cardKVf("published", "%lu ok / %lu failed", (unsigned long)sent.sent,
               (unsigned long)sent.failed);
    ui.cardKVf("capsules", "%lu sent / %lu fwd / %lu dropped", (unsigned long)sent.capsulesSent,
               (unsigned long)relayLink.getCapsulesForwarded(),
               (unsigned long)relayLink.getCapsulesDropped());
    ui.cardKVf("ecg", "%lu pkts, %lu drop, %lu bundles", (unsigned long)ecg.packetsPushed,
               (unsigned long)(ecg.packetsDropped + ecg.packetsOversize),
               (unsigned long)ecg.bundlesBuilt);
    ui.cardKVf("beats", "%lu (%lu RR rejected)", (unsigned long)ecg.beatsDetected,
               (unsigned long)ecg.rrRejected);
    ui.cardFooter();

    const char* phase = "DISCONNECTED";
    switch (wearable.getPhase()) {
        case WearablePhase::HR_ONLY: phase = "HR only"; break;
        case WearablePhase::ECG_STREAMING: phase = "ECG streaming"; break;
        default: break;
    }

    char broker[80];
    snprintf(broker, sizeof(broker), "%s:%u", config.mqtt.host, (unsigned)config.mqtt.port);

    ui.printLinkStatus(linkStateName(uplink.getState()), uplink.getCurrentSsid(), uplink.getRssi(),
                       uplink.isReal(), broker, failoverStateName(failover.getState()),
                       (unsigned)relayLink.viablePeerCount(now), phase);

    HrvMetrics hrv = pipeline.getHrv();
    float bpm = wearable.isWearableOk(now) ? (float)wearable.getLatestSample().bpm : NAN;
    ui.printVitals(bpm, pipeline.getLatestRrMs(), hrv.rmssdMs, hrv.sdnnMs,
                   publisher.getLatestEnvironment().tempC);
}

void NodeApplication::pollConsole() {
    while (Serial.available() > 0) {
        int c = Serial.read();
        if (c < 0) break;

        if (c == '\n' || c == '\r') {
            if (consoleLength == 0) continue;
            consoleLine[consoleLength] = '\0';
            handleCommand(consoleLine);
            consoleLength = 0;
        } else if (consoleLength < sizeof(consoleLine) - 1) {
            consoleLine[consoleLength++] = (char)c;
        }
    }
}

void NodeApplication::handleCommand(const char* command) {
    if (strcmp(command, "status") == 0) {
        printStatus(clock.monotonicMs());
    } else if (strcmp(command, "uplink down") == 0) {
        uplink.setForcedDown(true);
        ui.printCommandResult(command, true, "uplink forced down");
    } else if (strcmp(command, "uplink up") == 0) {
        uplink.setForcedDown(false);
        ui.printCommandResult(command, true, "uplink released");
    } else if (strcmp(command, "ecg on") == 0) {
        ecgEnabled = true;
        ui.printCommandResult(command, true, config.wearable.ecgOnlyWhenDirect ?
                              "ECG enabled while DIRECT" : "ECG enabled");
    } else if (strcmp(command, "ecg off") == 0) {
        ecgEnabled = false;
        ui.printCommandResult(command, true, "ECG disabled");
    } else {
        ui.printCommandResult(command, false, "try: status | uplink down|up | ecg on|off");
    }
}

void NodeApplication::updateLED(uint32_t now) {
    uint32_t period;

    switch (ledMode) {
        case LED_FAST: period = 200; break;
        case LED_SLOW: period = 800; break;
        case LED_ERROR: period = 100; break;
        default: digitalWrite(config.pins.ledPin, HIGH); return;
    }

    if (now - lastLedToggle >= period) {
        lastLedToggle = now;
        ledState = !ledState;
        digitalWrite(config.pins.ledPin, ledState ? LOW : HIGH);
    }
}
