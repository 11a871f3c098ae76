#include "NimBLEWearableTransport.h"
#include <string.h>

const NimBLEUUID NimBLEWearableTransport::HEART_RATE_SERVICE((uint16_t)0x180D);
const NimBLEUUID NimBLEWearableTransport::HEART_RATE_MEASUREMENT((uint16_t)0x2A37);
const NimBLEUUID NimBLEWearableTransport::PMD_SERVICE("FB005C80-02E7-F387-1CAD-8ACD2D8DF0C8");
const NimBLEUUID NimBLEWearableTransport::PMD_CONTROL("FB005C81-02E7-F387-1CAD-8ACD2D8DF0C8");
const NimBLEUUID NimBLEWearableTransport::PMD_DATA("FB005C82-02E7-F387-1CAD-8ACD2D8DF0C8");

NimBLEWearableTransport::NimBLEWearableTransport(ILogger* log)
    : logger(log), sink(nullptr), client(nullptr), peerFound(false), heartRateChar(nullptr),
      pmdControlChar(nullptr), pmdDataChar(nullptr) {
    name[0] = '\0';
}

bool NimBLEWearableTransport::initialize() {
    NimBLEDevice::init("");
    NimBLEDevice::setPower(ESP_PWR_LVL_P9);

    client = NimBLEDevice::createClient();
    if (!client) {
        if (logger) logger->error("NimBLE client allocation failed");
        return false;
    }

    client->setClientCallbacks(this, false);
    client->setConnectTimeout(5);
    return true;
}

bool NimBLEWearableTransport::scanForDevice(const char* namePrefix, uint32_t durationMs) {
    NimBLEScan* scan = NimBLEDevice::getScan();
    scan->setActiveScan(true);
    scan->setInterval(45);
    scan->setWindow(15);

    uint32_t seconds = (durationMs + 999) / 1000;
    NimBLEScanResults results = scan->start(seconds, false);

    size_t prefixLength = strlen(namePrefix);
    peerFound = false;

    for (int i = 0; i < results.getCount(); i++) {
        NimBLEAdvertisedDevice device = results.getDevice(i);
        std::string advertisedName = device.getName();
        if (advertisedName.compare(0, prefixLength, namePrefix) != 0) continue;

        peerAddress = device.getAddress();
        strncpy(name, advertisedName.c_str(), sizeof(name) - 1);
        name[sizeof(name) - 1] = '\0';
        peerFound = true;
        break;
    }

    scan->clearResults();

    if (peerFound && logger) logger->infof("Found %s (%s)", name, peerAddress.toString().c_str());
    return peerFound;
}

bool NimBLEWearableTransport::connect() {
    if (!client || !peerFound) return false;

    releaseCharacteristics();
    if (!client->connect(peerAddress)) {
        return false;
    }
    return true;
}

void NimBLEWearableTransport::disconnect() {
    if (client && client->isConnected()) client->disconnect();
    releaseCharacteristics();
}

bool NimBLEWearableTransport::isConnected() {
    return client && client->isConnected();
}

uint16_t NimBLEWearableTransport::negotiateMtu(uint16_t desired) {
    NimBLEDevice::setMTU(desired);
    return client ? client->getMTU() : 23;
}

bool NimBLEWearableTransport::subscribeHeartRate() {
    NimBLERemoteService* service = client->getService(HEART_RATE_SERVICE);
    if (!service) return false;

    heartRateChar = service->getCharacteristic(HEART_RATE_MEASUREMENT);
    if (!heartRateChar || !heartRateChar->canNotify()) return false;

    return heartRateChar->subscribe(true,
        [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            if (sink) sink->onHeartRateNotification(data, length);
        });
}

bool NimBLEWearableTransport::hasPmdService() {
    return client && client->getService(PMD_SERVICE) != nullptr;
}

bool NimBLEWearableTransport::subscribePmdControl() {
    NimBLERemoteService* service = client->getService(PMD_SERVICE);
    if (!service) return false;

    pmdControlChar = service->getCharacteristic(PMD_CONTROL);
    if (!pmdControlChar || !pmdControlChar->canIndicate()) return false;

    return pmdControlChar->subscribe(false,
        [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            if (sink) sink->onPmdControlResponse(data, length);
        }, true);
}

bool NimBLEWearableTransport::subscribePmdData() {
    NimBLERemoteService* service = client->getService(PMD_SERVICE);
    if (!service) return false;

    pmdDataChar = service->getCharacteristic(PMD_DATA);
    if (!pmdDataChar || !pmdDataChar->canNotify()) return false;

    return pmdDataChar->subscribe(true,
        [this](NimBLERemoteCharacteristic*, uint8_t* data, size_t length, bool) {
            if (sink) sink->onPmdData(data, length);
        });
}

bool NimBLEWearableTransport::writePmdControl(const uint8_t* data, size_t length) {
    if (!pmdControlChar || !isConnected()) return false;
    return pmdControlChar->writeValue(data, length, true);
}

void NimBLEWearableTransport::releaseCharacteristics() {
    heartRateChar = nullptr;
    pmdControlChar = nullptr;
    pmdDataChar = nullptr;
}

void NimBLEWearableTransport::onDisconnect(NimBLEClient* pClient) {
    (void)pClient;
    if (sink) sink->onWearableDisconnected();
}
