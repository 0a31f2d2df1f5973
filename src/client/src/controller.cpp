#include "tellcore/client/controller.h"
#include "tellcore/core/constants.h"

#include <stdexcept>

namespace tellcore {
namespace client {

std::string controllerPropertyName(ControllerProperty property) {
    switch (property) {
        case ControllerProperty::NAME:
            return "name";
        case ControllerProperty::SERIAL:
            return "serial";
        case ControllerProperty::FIRMWARE:
            return "firmware";
        case ControllerProperty::AVAILABLE:
            return "available";
    }
    throw std::invalid_argument("Unknown controller property");
}

Controller::Controller(core::ControllerInfo info,
                       std::shared_ptr<core::Library> library)
    : info_(std::move(info)), library_(std::move(library)) {
    if (!library_) {
        throw std::invalid_argument("Controller requires a library");
    }
}

std::optional<std::string>
Controller::property(ControllerProperty property) const {
    try {
        return library_->controllerValue(info_.id, controllerPropertyName(property));
    } catch (const core::NativeCallError& e) {
        if (e.code() == constants::TELLSTICK_ERROR_METHOD_NOT_SUPPORTED) {
            return std::nullopt;
        }
        throw;
    }
}

bool Controller::setProperty(ControllerProperty property,
                             const std::string& value) {
    try {
        library_->setControllerValue(info_.id, controllerPropertyName(property),
                                     value);
        return true;
    } catch (const core::NativeCallError& e) {
        if (e.code() == constants::TELLSTICK_ERROR_SYNTAX) {
            return false;
        }
        throw;
    }
}

std::optional<std::string> Controller::serial() const {
    return property(ControllerProperty::SERIAL);
}

std::optional<std::string> Controller::firmware() const {
    return property(ControllerProperty::FIRMWARE);
}

bool Controller::setName(const std::string& name) {
    if (!setProperty(ControllerProperty::NAME, name)) {
        return false;
    }
    info_.name = name;
    return true;
}

void Controller::remove() { library_->removeController(info_.id); }

} // namespace client
} // namespace tellcore
