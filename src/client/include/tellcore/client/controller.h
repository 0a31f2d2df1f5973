#pragma once

#include "tellcore/core/library.h"

#include <memory>
#include <optional>
#include <string>

namespace tellcore {
namespace client {

/**
 * @brief Controller properties reachable through tdControllerValue
 */
enum class ControllerProperty { NAME, SERIAL, FIRMWARE, AVAILABLE };

std::string controllerPropertyName(ControllerProperty property);

/**
 * @brief A TellStick controller reported by tdController
 */
class Controller {
public:
    Controller(core::ControllerInfo info, std::shared_ptr<core::Library> library);

    int id() const { return info_.id; }
    int type() const { return info_.type; }

    /**
     * @brief Name as reported when the controller was enumerated
     */
    const std::string& name() const { return info_.name; }
    bool available() const { return info_.available != 0; }

    /**
     * @brief Read a property from the library
     * @return Empty if the controller does not support the property
     */
    std::optional<std::string> property(ControllerProperty property) const;

    /**
     * @brief Write a property
     * @return false if the controller does not accept the property
     */
    bool setProperty(ControllerProperty property, const std::string& value);

    std::optional<std::string> serial() const;
    std::optional<std::string> firmware() const;
    bool setName(const std::string& name);

    void remove();

private:
    core::ControllerInfo info_;
    std::shared_ptr<core::Library> library_;
};

} // namespace client
} // namespace tellcore
