#ifndef IENVIRONMENT_SENSOR_H
#define IENVIRONMENT_SENSOR_H

#include <math.h>
#include <stdint.h>

enum class SensorStatus {
    OK,
    ERROR,
    NOT_INITIALIZED,
    NO_DATA,
    INVALID_READING
};

// Fields a board cannot measure stay NAN / -1 and serialize as null.
struct EnvironmentReading {
    float tempC;
    float humidityPct;
    int gasRaw;        // -1 = no reading
    int gasDigital;    // -1 = no reading
    float coPpm;
    SensorStatus status;

    EnvironmentReading()
        : tempC(NAN), humidityPct(NAN), gasRaw(-1), gasDigital(-1), coPpm(NAN),
          status(SensorStatus::NO_DATA) {}

    bool isValid() const {
        return status == SensorStatus::OK;
    }
};

class IEnvironmentSensor {
public:
    virtual ~IEnvironmentSensor() = default;
    virtual bool initialize() = 0;
    virtual EnvironmentReading read() = 0;
    virtual bool isReady() const = 0;
    virtual const char* getName() const = 0;
};

#endif
