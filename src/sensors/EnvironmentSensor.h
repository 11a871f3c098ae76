#ifndef ENVIRONMENT_SENSOR_H
#define ENVIRONMENT_SENSOR_H

#include <Adafruit_MLX90614.h>
#include "../../include/Config.h"
#include "../../include/IEnvironmentSensor.h"
#include "../../include/ILogger.h"

// Ambient temperature from the MLX90614 die sensor plus the MQ-2 gas
// module (analog level and comparator output). No humidity or CO channel.
class EnvironmentSensor : public IEnvironmentSensor {
private:
    Adafruit_MLX90614 mlx;
    ILogger* logger;
    const Config* config;

    bool initialized;
    bool mlxReady;
    float lastTempC;
    uint32_t readFailures;

    static constexpr int INIT_ATTEMPTS = 10;
    static constexpr int READ_ATTEMPTS = 3;

    static bool validateAmbient(float ambient1, float ambient2);
    float readTemperature();

public:
    EnvironmentSensor(ILogger* log, const Config* cfg);

    bool initialize() override;
    EnvironmentReading read() override;
    bool isReady() const override { return initialized; }
    const char* getName() const override { return "MLX90614+MQ2"; }
};

#endif
