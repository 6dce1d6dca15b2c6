#ifndef QUANTICA_QUANTITY_TYPE_HPP
#define QUANTICA_QUANTITY_TYPE_HPP

#include <array>
#include <cstddef>
#include <string>

namespace Quantica {

/**
 * @brief Physical dimension families known to the unit table
 *
 * Each quantity type has exactly one base unit; every other unit of the
 * type converts to and from it.
 */
enum class QuantityType {
    LENGTH,
    AREA,
    VOLUME,
    SPEED,
    ACCELERATION,
    FORCE,
    TORQUE,
    MASS,
    DURATION,
    KINEMATIC_VISCOSITY
};

constexpr std::size_t kQuantityTypeCount = 10;

constexpr std::array<QuantityType, kQuantityTypeCount> kAllQuantityTypes = {{
    QuantityType::LENGTH,
    QuantityType::AREA,
    QuantityType::VOLUME,
    QuantityType::SPEED,
    QuantityType::ACCELERATION,
    QuantityType::FORCE,
    QuantityType::TORQUE,
    QuantityType::MASS,
    QuantityType::DURATION,
    QuantityType::KINEMATIC_VISCOSITY
}};

// "Length", "KinematicViscosity", ...
std::string toString(QuantityType type);

/**
 * @brief Parse a quantity type name
 *
 * Accepts the display name ("KinematicViscosity") as well as the enum
 * spelling ("KINEMATIC_VISCOSITY"), case-insensitively.
 * @throws UnknownQuantityType if the name does not denote a quantity type
 */
QuantityType parseQuantityType(const std::string& name);

} // namespace Quantica

#endif // QUANTICA_QUANTITY_TYPE_HPP
