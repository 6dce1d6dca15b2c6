#include "UnitTable.hpp"
#include "QuantityErrors.hpp"
#include <algorithm>
#include <array>
#include <cctype>
#include <cmath>
#include <stdexcept>

namespace Quantica {

// =============================================================================
// Prefixes
// =============================================================================

namespace {

const std::array<PrefixInfo, 9>& prefixTable() {
    static const std::array<PrefixInfo, 9> table = {{
        {Prefix::NANO,  "Nano",  1e-9, "n",  {{"ru-RU", "н"}}},
        {Prefix::MICRO, "Micro", 1e-6, "µ",  {{"ru-RU", "мк"}}},
        {Prefix::MILLI, "Milli", 1e-3, "m",  {{"ru-RU", "м"}}},
        {Prefix::CENTI, "Centi", 1e-2, "c",  {{"ru-RU", "с"}}},
        {Prefix::DECI,  "Deci",  1e-1, "d",  {{"ru-RU", "д"}}},
        {Prefix::DECA,  "Deca",  1e1,  "da", {{"ru-RU", "да"}}},
        {Prefix::HECTO, "Hecto", 1e2,  "h",  {{"ru-RU", "г"}}},
        {Prefix::KILO,  "Kilo",  1e3,  "k",  {{"ru-RU", "к"}}},
        {Prefix::MEGA,  "Mega",  1e6,  "M",  {{"ru-RU", "М"}}}
    }};
    return table;
}

std::string lowerFirst(const std::string& str) {
    if (str.empty()) return str;
    std::string out = str;
    out[0] = static_cast<char>(std::tolower(static_cast<unsigned char>(out[0])));
    return out;
}

std::string toLowerCase(const std::string& str) {
    std::string out = str;
    std::transform(out.begin(), out.end(), out.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return out;
}

} // namespace

const std::string& PrefixInfo::abbreviation(const std::string& culture) const {
    auto it = localized.find(culture);
    if (it != localized.end()) {
        return it->second;
    }
    return symbol;
}

const PrefixInfo& UnitTable::prefixInfo(Prefix prefix) {
    return prefixTable()[static_cast<std::size_t>(prefix)];
}

// =============================================================================
// Construction
// =============================================================================

const UnitTable& UnitTable::instance() {
    static const UnitTable table;
    return table;
}

UnitTable::UnitTable() {
    quantities_.resize(kQuantityTypeCount);

    addLengthUnits();
    addAreaUnits();
    addVolumeUnits();
    addSpeedUnits();
    addAccelerationUnits();
    addForceUnits();
    addTorqueUnits();
    addMassUnits();
    addDurationUnits();
    addKinematicViscosityUnits();
}

QuantityInfo& UnitTable::addQuantity(QuantityType type) {
    QuantityInfo& quantity = quantities_[static_cast<std::size_t>(type)];
    quantity.type = type;
    quantity.name = toString(type);
    quantity.units.clear();
    return quantity;
}

void UnitTable::registerUnit(QuantityInfo& quantity, const UnitInfo& unit) {
    UnitInfo entry = unit;
    entry.quantity_type = quantity.type;
    quantity.units.push_back(entry);
}

void UnitTable::finalizeQuantity(QuantityInfo& quantity, const std::string& base_unit_name) {
    // Each declared unit is followed by the units generated from its prefixes
    std::vector<UnitInfo> expanded;
    for (const auto& unit : quantity.units) {
        const std::size_t base_index = expanded.size();

        UnitInfo declared = unit;
        declared.index = base_index;
        declared.prefix_base = base_index;
        expanded.push_back(declared);

        for (Prefix prefix : unit.prefixes) {
            const PrefixInfo& info = prefixInfo(prefix);

            UnitInfo derived;
            derived.name = info.name + lowerFirst(unit.name);
            derived.plural_name = info.name + lowerFirst(unit.plural_name);
            derived.quantity_type = quantity.type;
            derived.factor = info.factor * unit.factor;
            derived.prefix = prefix;
            derived.prefix_base = base_index;
            derived.index = expanded.size();
            expanded.push_back(derived);
        }
    }
    quantity.units = std::move(expanded);

    auto it = std::find_if(quantity.units.begin(), quantity.units.end(),
                           [&](const UnitInfo& u) { return u.name == base_unit_name; });
    if (it == quantity.units.end()) {
        throw std::runtime_error("Base unit " + base_unit_name + " not declared for " +
                                 quantity.name);
    }
    if (std::abs(it->factor - 1.0) > 1e-12 || it->offset != 0.0) {
        throw std::runtime_error("Base unit " + base_unit_name + " of " + quantity.name +
                                 " must have unit factor and no offset");
    }
    quantity.base_unit = it->index;
}

UnitInfo makeUnit(const std::string& name, const std::string& plural_name,
                  double factor,
                  std::map<std::string, std::vector<std::string>> abbreviations,
                  std::vector<Prefix> prefixes) {
    UnitInfo unit;
    unit.name = name;
    unit.plural_name = plural_name;
    unit.factor = factor;
    unit.abbreviations = std::move(abbreviations);
    unit.prefixes = std::move(prefixes);
    return unit;
}

// =============================================================================
// Lookup
// =============================================================================

const QuantityInfo& UnitTable::quantity(QuantityType type) const {
    return quantities_[static_cast<std::size_t>(type)];
}

const UnitInfo* UnitTable::findUnit(QuantityType type, const std::string& name) const {
    const auto& units = quantity(type).units;

    // Try exact match first
    for (const auto& unit : units) {
        if (unit.name == name || unit.plural_name == name) {
            return &unit;
        }
    }

    // Then case-insensitive
    const std::string lowered = toLowerCase(name);
    for (const auto& unit : units) {
        if (toLowerCase(unit.name) == lowered || toLowerCase(unit.plural_name) == lowered) {
            return &unit;
        }
    }

    return nullptr;
}

const UnitInfo& UnitTable::getUnit(QuantityType type, const std::string& name) const {
    const UnitInfo* unit = findUnit(type, name);
    if (!unit) {
        throw UnknownUnit("Unknown unit " + name + " for quantity " + toString(type));
    }
    return *unit;
}

const UnitInfo& UnitTable::prefixBase(const UnitInfo& unit) const {
    return quantity(unit.quantity_type).units[unit.prefix_base];
}

std::size_t UnitTable::unitCount() const {
    std::size_t count = 0;
    for (const auto& q : quantities_) {
        count += q.units.size();
    }
    return count;
}

} // namespace Quantica
