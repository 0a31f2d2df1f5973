#include "tellcore/client/sensor.h"
#include "tellcore/core/constants.h"

#include <stdexcept>

namespace tellcore {
namespace client {

using namespace constants;

Sensor::Sensor(core::SensorInfo info, std::shared_ptr<core::Library> library)
    : info_(std::move(info)), library_(std::move(library)) {
    if (!library_) {
        throw std::invalid_argument("Sensor requires a library");
    }
}

SensorValue Sensor::value(int datatype) const {
    core::SensorReading reading =
        library_->sensorValue(info_.protocol, info_.model, info_.id, datatype);
    return SensorValue(datatype, reading.value, reading.timestamp);
}

bool Sensor::hasTemperature() const { return has(TELLSTICK_TEMPERATURE); }
SensorValue Sensor::temperature() const { return value(TELLSTICK_TEMPERATURE); }

bool Sensor::hasHumidity() const { return has(TELLSTICK_HUMIDITY); }
SensorValue Sensor::humidity() const { return value(TELLSTICK_HUMIDITY); }

bool Sensor::hasRainRate() const { return has(TELLSTICK_RAINRATE); }
SensorValue Sensor::rainRate() const { return value(TELLSTICK_RAINRATE); }

bool Sensor::hasRainTotal() const { return has(TELLSTICK_RAINTOTAL); }
SensorValue Sensor::rainTotal() const { return value(TELLSTICK_RAINTOTAL); }

bool Sensor::hasWindDirection() const { return has(TELLSTICK_WINDDIRECTION); }
SensorValue Sensor::windDirection() const {
    return value(TELLSTICK_WINDDIRECTION);
}

bool Sensor::hasWindAverage() const { return has(TELLSTICK_WINDAVERAGE); }
SensorValue Sensor::windAverage() const { return value(TELLSTICK_WINDAVERAGE); }

bool Sensor::hasWindGust() const { return has(TELLSTICK_WINDGUST); }
SensorValue Sensor::windGust() const { return value(TELLSTICK_WINDGUST); }

} // namespace client
} // namespace tellcore
