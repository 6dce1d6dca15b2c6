#include "QuantityType.hpp"
#include "QuantityErrors.hpp"
#include <cctype>

namespace Quantica {

std::string toString(QuantityType type) {
    switch (type) {
        case QuantityType::LENGTH:              return "Length";
        case QuantityType::AREA:                return "Area";
        case QuantityType::VOLUME:              return "Volume";
        case QuantityType::SPEED:               return "Speed";
        case QuantityType::ACCELERATION:        return "Acceleration";
        case QuantityType::FORCE:               return "Force";
        case QuantityType::TORQUE:              return "Torque";
        case QuantityType::MASS:                return "Mass";
        case QuantityType::DURATION:            return "Duration";
        case QuantityType::KINEMATIC_VISCOSITY: return "KinematicViscosity";
    }
    return "Unknown";
}

QuantityType parseQuantityType(const std::string& name) {
    auto normalize = [](const std::string& s) {
        std::string out;
        for (char c : s) {
            if (c == '_' || c == ' ') continue;
            out += static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
        }
        return out;
    };

    std::string key = normalize(name);
    for (QuantityType type : kAllQuantityTypes) {
        if (normalize(toString(type)) == key) {
            return type;
        }
    }
    throw UnknownQuantityType("Unknown quantity type: " + name);
}

} // namespace Quantica
