#ifndef QUANTICA_UNIT_TABLE_HPP
#define QUANTICA_UNIT_TABLE_HPP

#include "QuantityType.hpp"
#include <cstddef>
#include <map>
#include <optional>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief Metric prefixes a unit may compose with
 */
enum class Prefix {
    NANO,
    MICRO,
    MILLI,
    CENTI,
    DECI,
    DECA,
    HECTO,
    KILO,
    MEGA
};

/**
 * @brief Prefix metadata: name, factor and per-culture symbols
 *
 * symbol is used for any culture without a localized entry.
 */
struct PrefixInfo {
    Prefix prefix;
    std::string name;           // "Kilo"
    double factor;              // 1e3
    std::string symbol;         // "k"
    std::map<std::string, std::string> localized;  // culture -> symbol ("ru-RU" -> "к")

    const std::string& abbreviation(const std::string& culture) const;
};

/**
 * @brief Unit definition with conversion to the quantity's base unit
 *
 * Conversions are affine: base = (value + offset) * factor. Prefixed units
 * (Kilogram, Millimeter) are generated from the unit declaring the prefix
 * and record which unit they derive from; they carry no abbreviations of
 * their own unless declared explicitly.
 */
struct UnitInfo {
    std::string name;                  // "Foot"
    std::string plural_name;           // "Feet"
    QuantityType quantity_type = QuantityType::LENGTH;
    double factor = 1.0;               // Multiplier to the base unit
    double offset = 0.0;               // Offset applied before scaling
    std::vector<Prefix> prefixes;      // Prefixes this unit composes with
    std::map<std::string, std::vector<std::string>> abbreviations;  // culture -> abbreviations

    std::optional<Prefix> prefix;      // Set for generated prefixed units
    std::size_t prefix_base = 0;       // Index of the unprefixed unit
    std::size_t index = 0;             // Declaration order within the quantity

    double toBase(double value) const {
        return (value + offset) * factor;
    }

    double fromBase(double value) const {
        return value / factor - offset;
    }

    bool isPrefixed() const { return prefix.has_value(); }
};

/**
 * @brief All units of one quantity type, in declaration order
 */
struct QuantityInfo {
    QuantityType type = QuantityType::LENGTH;
    std::string name;
    std::size_t base_unit = 0;
    std::vector<UnitInfo> units;

    const UnitInfo& baseUnit() const { return units[base_unit]; }
};

/**
 * @brief Immutable, process-wide unit definition table
 *
 * Built once on first access and read-only afterwards, so references and
 * pointers to its UnitInfo entries stay valid for the life of the process
 * and may be shared across threads.
 */
class UnitTable {
public:
    static const UnitTable& instance();

    UnitTable(const UnitTable&) = delete;
    UnitTable& operator=(const UnitTable&) = delete;

    // =========================================================================
    // Lookup
    // =========================================================================

    const QuantityInfo& quantity(QuantityType type) const;
    const std::vector<QuantityInfo>& quantities() const { return quantities_; }

    const std::vector<UnitInfo>& units(QuantityType type) const {
        return quantity(type).units;
    }

    const UnitInfo& baseUnit(QuantityType type) const {
        return quantity(type).baseUnit();
    }

    /**
     * @brief Find a unit by name ("Foot") or plural name ("Feet")
     * @return Pointer to the unit, or nullptr if the type has no such unit
     */
    const UnitInfo* findUnit(QuantityType type, const std::string& name) const;

    /**
     * @brief Get a unit by name
     * @throws UnknownUnit if the type has no such unit
     */
    const UnitInfo& getUnit(QuantityType type, const std::string& name) const;

    /**
     * @brief The unit a prefixed unit was generated from (itself otherwise)
     */
    const UnitInfo& prefixBase(const UnitInfo& unit) const;

    static const PrefixInfo& prefixInfo(Prefix prefix);

    std::size_t unitCount() const;

private:
    UnitTable();

    // Unit declarations per quantity, see UnitDefinitions.cpp
    void addLengthUnits();
    void addAreaUnits();
    void addVolumeUnits();
    void addSpeedUnits();
    void addAccelerationUnits();
    void addForceUnits();
    void addTorqueUnits();
    void addMassUnits();
    void addDurationUnits();
    void addKinematicViscosityUnits();

    QuantityInfo& addQuantity(QuantityType type);
    void registerUnit(QuantityInfo& quantity, const UnitInfo& unit);

    // Generate prefixed units, assign indices, locate the base unit
    void finalizeQuantity(QuantityInfo& quantity, const std::string& base_unit_name);

    std::vector<QuantityInfo> quantities_;
};

/**
 * @brief Helper for declaring units in UnitDefinitions.cpp
 */
UnitInfo makeUnit(const std::string& name, const std::string& plural_name,
                  double factor,
                  std::map<std::string, std::vector<std::string>> abbreviations,
                  std::vector<Prefix> prefixes = {});

} // namespace Quantica

#endif // QUANTICA_UNIT_TABLE_HPP
