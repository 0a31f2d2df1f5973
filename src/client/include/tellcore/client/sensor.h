#pragma once

#include "tellcore/core/library.h"

#include <memory>
#include <string>

namespace tellcore {
namespace client {

/**
 * @brief One reading of a sensor
 */
class SensorValue {
public:
    SensorValue(int datatype, std::string value, int timestamp)
        : datatype_(datatype), value_(std::move(value)), timestamp_(timestamp) {}

    int datatype() const { return datatype_; }
    const std::string& value() const { return value_; }
    int timestamp() const { return timestamp_; }

private:
    int datatype_;
    std::string value_;
    int timestamp_;
};

/**
 * @brief A sensor reported by tdSensor
 */
class Sensor {
public:
    Sensor(core::SensorInfo info, std::shared_ptr<core::Library> library);

    const std::string& protocol() const { return info_.protocol; }
    const std::string& model() const { return info_.model; }
    int id() const { return info_.id; }

    /**
     * @brief Bitmask of the TELLSTICK_* sensor value types
     */
    int datatypes() const { return info_.dataTypes; }

    bool has(int datatype) const { return (info_.dataTypes & datatype) != 0; }

    /**
     * @brief Read the latest value of one datatype
     * @throws core::NativeCallError if the sensor has no such value
     */
    SensorValue value(int datatype) const;

    bool hasTemperature() const;
    SensorValue temperature() const;
    bool hasHumidity() const;
    SensorValue humidity() const;
    bool hasRainRate() const;
    SensorValue rainRate() const;
    bool hasRainTotal() const;
    SensorValue rainTotal() const;
    bool hasWindDirection() const;
    SensorValue windDirection() const;
    bool hasWindAverage() const;
    SensorValue windAverage() const;
    bool hasWindGust() const;
    SensorValue windGust() const;

private:
    core::SensorInfo info_;
    std::shared_ptr<core::Library> library_;
};

} // namespace client
} // namespace tellcore
