#ifndef QUANTICA_QUANTITY_HPP
#define QUANTICA_QUANTITY_HPP

#include "UnitTable.hpp"
#include <ostream>
#include <string>

namespace Quantica {

/**
 * @brief Immutable physical quantity: a value in one unit of its type
 *
 * The unit points into the process-wide UnitTable, so quantities are cheap
 * to copy and safe to share between threads. Arithmetic and comparison work
 * on base values.
 */
class Quantity {
public:
    // Zero in the Length base unit
    Quantity();

    Quantity(double value, const UnitInfo& unit);

    /**
     * @brief Quantity expressed in the base unit of a type
     */
    static Quantity fromBase(double base_value, QuantityType type);

    /**
     * @brief Quantity from a value and a unit name ("Foot" or "Feet")
     * @throws UnknownUnit if the type has no such unit
     */
    static Quantity from(double value, QuantityType type, const std::string& unit_name);

    double value() const { return value_; }
    const UnitInfo& unit() const { return *unit_; }
    QuantityType type() const { return unit_->quantity_type; }

    double baseValue() const { return unit_->toBase(value_); }

    // =========================================================================
    // Conversion
    // =========================================================================

    /**
     * @brief Numeric value in another unit of the same type
     * @throws DimensionMismatch if the unit belongs to another type
     */
    double as(const UnitInfo& unit) const;

    /**
     * @throws UnknownUnit if the type has no such unit
     */
    double as(const std::string& unit_name) const;

    Quantity to(const UnitInfo& unit) const;
    Quantity to(const std::string& unit_name) const;

    /**
     * @brief Compare base values with an absolute tolerance in base units
     * @return false if the types differ
     */
    bool equals(const Quantity& other, double tolerance) const;

    // =========================================================================
    // Same-type arithmetic
    // =========================================================================

    Quantity operator-() const;

    /**
     * @brief Sum of two quantities of one type, in the left operand's unit
     * @throws DimensionMismatch if the types differ
     */
    Quantity operator+(const Quantity& other) const;
    Quantity operator-(const Quantity& other) const;

    Quantity operator*(double scale) const;
    Quantity operator/(double scale) const;

    // Same type and exactly equal base values
    bool operator==(const Quantity& other) const;
    bool operator!=(const Quantity& other) const;

    // Ordering; throws DimensionMismatch if the types differ
    bool operator<(const Quantity& other) const;
    bool operator<=(const Quantity& other) const;
    bool operator>(const Quantity& other) const;
    bool operator>=(const Quantity& other) const;

private:
    void requireSameType(const Quantity& other, const char* operation) const;

    double value_;
    const UnitInfo* unit_;
};

Quantity operator*(double scale, const Quantity& quantity);

// "2.5 Kilogram"
std::ostream& operator<<(std::ostream& os, const Quantity& quantity);

// =============================================================================
// Feet and inches
// =============================================================================

/**
 * @brief A length split into whole feet and the remaining inches
 *
 * feet is rounded down, so inches is always in [0, 12): -20 in is
 * -2 ft + 4 in.
 */
struct FeetInches {
    double feet = 0.0;
    double inches = 0.0;
};

/**
 * @throws DimensionMismatch if the quantity is not a Length
 */
FeetInches toFeetInches(const Quantity& length);

// Length in feet: feet + inches / 12
Quantity fromFeetInches(double feet, double inches);

} // namespace Quantica

#endif // QUANTICA_QUANTITY_HPP
