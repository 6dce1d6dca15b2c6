#include "Quantity.hpp"
#include "QuantityErrors.hpp"
#include <cmath>

namespace Quantica {

Quantity::Quantity()
    : value_(0.0), unit_(&UnitTable::instance().baseUnit(QuantityType::LENGTH)) {}

Quantity::Quantity(double value, const UnitInfo& unit)
    : value_(value), unit_(&unit) {}

Quantity Quantity::fromBase(double base_value, QuantityType type) {
    return Quantity(base_value, UnitTable::instance().baseUnit(type));
}

Quantity Quantity::from(double value, QuantityType type, const std::string& unit_name) {
    return Quantity(value, UnitTable::instance().getUnit(type, unit_name));
}

// =============================================================================
// Conversion
// =============================================================================

double Quantity::as(const UnitInfo& unit) const {
    if (unit.quantity_type != type()) {
        throw DimensionMismatch("Cannot express " + toString(type()) + " in " + unit.name +
                                " (" + toString(unit.quantity_type) + ")");
    }
    if (&unit == unit_) {
        return value_;
    }
    return unit.fromBase(baseValue());
}

double Quantity::as(const std::string& unit_name) const {
    return as(UnitTable::instance().getUnit(type(), unit_name));
}

Quantity Quantity::to(const UnitInfo& unit) const {
    return Quantity(as(unit), unit);
}

Quantity Quantity::to(const std::string& unit_name) const {
    return to(UnitTable::instance().getUnit(type(), unit_name));
}

bool Quantity::equals(const Quantity& other, double tolerance) const {
    if (type() != other.type()) {
        return false;
    }
    return std::abs(baseValue() - other.baseValue()) <= tolerance;
}

// =============================================================================
// Arithmetic
// =============================================================================

void Quantity::requireSameType(const Quantity& other, const char* operation) const {
    if (type() != other.type()) {
        throw DimensionMismatch(std::string("Cannot ") + operation + " " +
                                toString(type()) + " and " + toString(other.type()));
    }
}

Quantity Quantity::operator-() const {
    return Quantity(-value_, *unit_);
}

Quantity Quantity::operator+(const Quantity& other) const {
    requireSameType(other, "add");
    return Quantity(unit_->fromBase(baseValue() + other.baseValue()), *unit_);
}

Quantity Quantity::operator-(const Quantity& other) const {
    requireSameType(other, "subtract");
    return Quantity(unit_->fromBase(baseValue() - other.baseValue()), *unit_);
}

Quantity Quantity::operator*(double scale) const {
    return Quantity(value_ * scale, *unit_);
}

Quantity Quantity::operator/(double scale) const {
    return Quantity(value_ / scale, *unit_);
}

Quantity operator*(double scale, const Quantity& quantity) {
    return quantity * scale;
}

bool Quantity::operator==(const Quantity& other) const {
    return type() == other.type() && baseValue() == other.baseValue();
}

bool Quantity::operator!=(const Quantity& other) const {
    return !(*this == other);
}

bool Quantity::operator<(const Quantity& other) const {
    requireSameType(other, "compare");
    return baseValue() < other.baseValue();
}

bool Quantity::operator<=(const Quantity& other) const {
    requireSameType(other, "compare");
    return baseValue() <= other.baseValue();
}

bool Quantity::operator>(const Quantity& other) const {
    requireSameType(other, "compare");
    return baseValue() > other.baseValue();
}

bool Quantity::operator>=(const Quantity& other) const {
    requireSameType(other, "compare");
    return baseValue() >= other.baseValue();
}

std::ostream& operator<<(std::ostream& os, const Quantity& quantity) {
    os << quantity.value() << " " << quantity.unit().name;
    return os;
}

// =============================================================================
// Feet and inches
// =============================================================================

FeetInches toFeetInches(const Quantity& length) {
    if (length.type() != QuantityType::LENGTH) {
        throw DimensionMismatch("Feet and inches need a Length, got " +
                                toString(length.type()));
    }

    const double total_inches = length.as("Inch");
    FeetInches result;
    result.feet = std::floor(total_inches / 12.0);
    result.inches = total_inches - result.feet * 12.0;
    return result;
}

Quantity fromFeetInches(double feet, double inches) {
    return Quantity::from(feet + inches / 12.0, QuantityType::LENGTH, "Foot");
}

} // namespace Quantica
