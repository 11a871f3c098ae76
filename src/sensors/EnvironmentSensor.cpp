#include "EnvironmentSensor.h"
#include <Wire.h>

EnvironmentSensor::EnvironmentSensor(ILogger* log, const Config* cfg)
    : logger(log), config(cfg), initialized(false), mlxReady(false), lastTempC(NAN), readFailures(0) {
}

bool EnvironmentSensor::initialize() {
    if (logger) logger->info("Initializing environment sensor");

    pinMode(config->pins.gasAnalogPin, INPUT);
    pinMode(config->pins.gasDigitalPin, INPUT);

    Wire.begin(config->pins.sdaPin, config->pins.sclPin);

    for (int retry = 0; retry < INIT_ATTEMPTS && !mlxReady; retry++) {
        if (logger) logger->debugf("MLX90614 init attempt %d", retry + 1);
        if (mlx.begin()) {
            mlxReady = true;
            break;
        }
        delay(250);
        yield();
    }

    if (mlxReady) {
        if (logger) logger->info("MLX90614 initialized successfully");
    } else {
        if (logger) logger->error("MLX90614 initialization failed, gas channel only");
    }

    // The gas channel needs no bus; the sensor is usable either way.
    initialized = true;
    return true;
}

bool EnvironmentSensor::validateAmbient(float ambient1, float ambient2) {
    return !isnan(ambient1) && !isnan(ambient2) &&
           ambient1 > -40.0f && ambient1 < 125.0f &&
           fabsf(ambient1 - ambient2) <= 1.0f;
}

float EnvironmentSensor::readTemperature() {
    if (!mlxReady) return NAN;

    for (int attempt = 0; attempt < READ_ATTEMPTS; attempt++) {
        float ambient1 = mlx.readAmbientTempC();
        delayMicroseconds(500);
        float ambient2 = mlx.readAmbientTempC();

        if (validateAmbient(ambient1, ambient2)) {
            return 0.5f * (ambient1 + ambient2);
        }
        delay(2);
    }

    readFailures++;
    if (logger) logger->warningf("MLX90614 read validation failed (%lu total)",
                                 (unsigned long)readFailures);
    return NAN;
}

EnvironmentReading EnvironmentSensor::read() {
    EnvironmentReading reading;
    if (!initialized) {
        reading.status = SensorStatus::NOT_INITIALIZED;
        return reading;
    }

    float tempC = readTemperature();
    if (!isnan(tempC)) lastTempC = tempC;

    reading.tempC = lastTempC;
    reading.gasRaw = analogRead(config->pins.gasAnalogPin);
    // MQ-2 comparator output is active low.
    reading.gasDigital = digitalRead(config->pins.gasDigitalPin) == LOW ? 1 : 0;
    reading.status = isnan(tempC) ? SensorStatus::INVALID_READING : SensorStatus::OK;
    return reading;
}
