#ifndef PMD_PROTOCOL_H
#define PMD_PROTOCOL_H

#include <stddef.h>
#include <stdint.h>

/**
 * Vendor streaming (PMD) control point and ECG data framing.
 *
 * Control point request:   opcode, measurement type [, settings...]
 * Control point response:  0xF0, opcode, measurement type, status, more, settings...
 * ECG data notification:   type 0x00, timestamp u64 LE (ns), frame type, samples (i24 LE, uV)
 */
class PmdProtocol {
public:
    static constexpr uint8_t OP_GET_SETTINGS = 0x01;
    static constexpr uint8_t OP_START = 0x02;
    static constexpr uint8_t OP_STOP = 0x03;
    static constexpr uint8_t RESPONSE_CODE = 0xF0;
    static constexpr uint8_t MEASUREMENT_ECG = 0x00;
    static constexpr uint8_t STATUS_SUCCESS = 0x00;
    static constexpr uint8_t SETTING_SAMPLE_RATE = 0x00;
    static constexpr uint8_t FRAME_RAW = 0x00;

    static constexpr size_t STATUS_OFFSET = 3;
    static constexpr size_t SETTINGS_OFFSET = 5;
    static constexpr size_t DATA_HEADER_BYTES = 10;
    static constexpr size_t MAX_COMMAND_BYTES = 32;

    static size_t buildGetSettings(uint8_t* out, size_t size);
    static size_t buildStop(uint8_t* out, size_t size);

    // Start command = OP_START, ECG, then the device-reported settings bytes.
    // Returns 0 if the settings response is malformed or does not fit.
    static size_t buildStart(const uint8_t* settingsResponse, size_t length,
                             uint8_t* out, size_t size);

    // True if the response is for the given opcode; status is taken from STATUS_OFFSET.
    static bool readStatus(const uint8_t* response, size_t length, uint8_t opcode,
                           uint8_t& status);

    static bool isSuccess(const uint8_t* response, size_t length, uint8_t opcode);

    // Walks the settings TLVs (type, count, count x u16) for the first sample rate.
    static bool findSampleRate(const uint8_t* settingsResponse, size_t length, uint16_t& hz);

    // Decodes raw ECG samples; returns the sample count or -1 for a packet
    // that is not an uncompressed ECG frame.
    static int decodeEcgSamples(const uint8_t* packet, size_t length,
                                int32_t* samples, size_t maxSamples);
};

#endif
