#include "PmdProtocol.h"
#include <string.h>

constexpr uint8_t PmdProtocol::OP_GET_SETTINGS;
constexpr uint8_t PmdProtocol::OP_START;
constexpr uint8_t PmdProtocol::OP_STOP;
constexpr uint8_t PmdProtocol::RESPONSE_CODE;
constexpr uint8_t PmdProtocol::MEASUREMENT_ECG;
constexpr uint8_t PmdProtocol::STATUS_SUCCESS;
constexpr uint8_t PmdProtocol::SETTING_SAMPLE_RATE;
constexpr uint8_t PmdProtocol::FRAME_RAW;
constexpr size_t PmdProtocol::STATUS_OFFSET;
constexpr size_t PmdProtocol::SETTINGS_OFFSET;
constexpr size_t PmdProtocol::DATA_HEADER_BYTES;
constexpr size_t PmdProtocol::MAX_COMMAND_BYTES;

size_t PmdProtocol::buildGetSettings(uint8_t* out, size_t size) {
    if (!out || size < 2) return 0;
    out[0] = OP_GET_SETTINGS;
    out[1] = MEASUREMENT_ECG;
    return 2;
}

size_t PmdProtocol::buildStop(uint8_t* out, size_t size) {
    if (!out || size < 2) return 0;
    out[0] = OP_STOP;
    out[1] = MEASUREMENT_ECG;
    return 2;
}

bool PmdProtocol::readStatus(const uint8_t* response, size_t length, uint8_t opcode,
                             uint8_t& status) {
    if (!response || length <= STATUS_OFFSET) return false;
    if (response[0] != RESPONSE_CODE || response[1] != opcode) return false;
    status = response[STATUS_OFFSET];
    return true;
}

bool PmdProtocol::isSuccess(const uint8_t* response, size_t length, uint8_t opcode) {
    uint8_t status = 0xFF;
    return readStatus(response, length, opcode, status) && status == STATUS_SUCCESS;
}

size_t PmdProtocol::buildStart(const uint8_t* settingsResponse, size_t length,
                               uint8_t* out, size_t size) {
    if (!isSuccess(settingsResponse, length, OP_GET_SETTINGS)) return 0;
    if (length <= SETTINGS_OFFSET) return 0;

    size_t settingsLength = length - SETTINGS_OFFSET;
    if (!out || size < 2 + settingsLength) return 0;

    out[0] = OP_START;
    out[1] = MEASUREMENT_ECG;
    memcpy(&out[2], &settingsResponse[SETTINGS_OFFSET], settingsLength);
    return 2 + settingsLength;
}

bool PmdProtocol::findSampleRate(const uint8_t* settingsResponse, size_t length, uint16_t& hz) {
    if (!settingsResponse || length <= SETTINGS_OFFSET) return false;

    size_t offset = SETTINGS_OFFSET;
    while (offset + 2 <= length) {
        uint8_t type = settingsResponse[offset];
        uint8_t count = settingsResponse[offset + 1];
        offset += 2;
        if (count == 0 || offset + (size_t)count * 2 > length) return false;

        if (type == SETTING_SAMPLE_RATE) {
            hz = (uint16_t)(settingsResponse[offset] | (settingsResponse[offset + 1] << 8));
            return hz > 0;
        }
        offset += (size_t)count * 2;
    }

    return false;
}

int PmdProtocol::decodeEcgSamples(const uint8_t* packet, size_t length,
                                  int32_t* samples, size_t maxSamples) {
    if (!packet || length < DATA_HEADER_BYTES) return -1;
    if (packet[0] != MEASUREMENT_ECG || packet[DATA_HEADER_BYTES - 1] != FRAME_RAW) return -1;

    size_t available = (length - DATA_HEADER_BYTES) / 3;
    size_t n = available < maxSamples ? available : maxSamples;

    const uint8_t* p = &packet[DATA_HEADER_BYTES];
    for (size_t i = 0; i < n; i++, p += 3) {
        uint32_t raw = (uint32_t)p[0] | ((uint32_t)p[1] << 8) | ((uint32_t)p[2] << 16);
        if (raw & 0x00800000u) raw |= 0xFF000000u;
        samples[i] = (int32_t)raw;
    }

    return (int)n;
}
