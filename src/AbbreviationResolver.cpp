#include "AbbreviationResolver.hpp"
#include "QuantityErrors.hpp"
#include <algorithm>

namespace Quantica {

namespace {

void appendUnique(std::vector<std::string>& list, const std::string& value) {
    if (value.empty()) return;
    if (std::find(list.begin(), list.end(), value) == list.end()) {
        list.push_back(value);
    }
}

} // namespace

AbbreviationResolver::AbbreviationResolver(const UnitTable& table,
                                           const std::string& fallback_culture)
    : table_(table), fallback_culture_(fallback_culture) {}

// =============================================================================
// Collection
// =============================================================================

std::vector<std::string> AbbreviationResolver::declared(const UnitInfo& unit,
                                                        const std::string& culture) const {
    std::vector<std::string> result;

    auto it = unit.abbreviations.find(culture);
    if (it != unit.abbreviations.end()) {
        for (const auto& abbreviation : it->second) {
            appendUnique(result, abbreviation);
        }
    }

    auto custom_it = custom_.find(Key(unit.quantity_type, unit.index, culture));
    if (custom_it != custom_.end()) {
        for (const auto& abbreviation : custom_it->second) {
            appendUnique(result, abbreviation);
        }
    }

    return result;
}

std::vector<std::string> AbbreviationResolver::collect(const UnitInfo& unit,
                                                       const std::string& culture) const {
    std::vector<std::string> result = declared(unit, culture);

    if (unit.isPrefixed()) {
        // No recursive prefixing: the base of a prefixed unit never is one
        const UnitInfo& base = table_.prefixBase(unit);
        const std::string& symbol = UnitTable::prefixInfo(*unit.prefix).abbreviation(culture);
        for (const auto& abbreviation : declared(base, culture)) {
            appendUnique(result, symbol + abbreviation);
        }
    }

    return result;
}

std::vector<std::string> AbbreviationResolver::resolve(QuantityType type, const UnitInfo& unit,
                                                       const std::string& culture) const {
    if (unit.quantity_type != type) {
        throw UnknownUnit("Unit " + unit.name + " does not belong to " + toString(type));
    }

    std::vector<std::string> result = collect(unit, culture);
    if (result.empty() && culture != fallback_culture_) {
        result = collect(unit, fallback_culture_);
    }
    return result;
}

// =============================================================================
// Public Interface
// =============================================================================

std::vector<std::string> AbbreviationResolver::abbreviationsFor(QuantityType type,
                                                                const UnitInfo& unit,
                                                                const std::string& culture) const {
    std::vector<std::string> result = resolve(type, unit, culture);
    if (result.empty()) {
        throw AbbreviationNotFound(type, unit.name, culture);
    }

    // Longest first so regex alternation prefers "kg" over "g"
    std::stable_sort(result.begin(), result.end(),
                     [](const std::string& a, const std::string& b) {
                         return a.length() > b.length();
                     });
    return result;
}

std::string AbbreviationResolver::defaultAbbreviation(QuantityType type, const UnitInfo& unit,
                                                      const std::string& culture) const {
    std::vector<std::string> result = resolve(type, unit, culture);
    if (result.empty()) {
        throw AbbreviationNotFound(type, unit.name, culture);
    }
    return result.front();
}

std::vector<UnitMatch> AbbreviationResolver::unitsFor(const std::string& abbreviation,
                                                      const std::string& culture) const {
    std::vector<UnitMatch> result;
    for (QuantityType type : kAllQuantityTypes) {
        auto matches = unitsFor(abbreviation, type, culture);
        result.insert(result.end(), matches.begin(), matches.end());
    }
    return result;
}

std::vector<UnitMatch> AbbreviationResolver::unitsFor(const std::string& abbreviation,
                                                      QuantityType type,
                                                      const std::string& culture) const {
    std::vector<UnitMatch> result;
    for (const auto& unit : table_.units(type)) {
        auto abbreviations = resolve(type, unit, culture);
        if (std::find(abbreviations.begin(), abbreviations.end(), abbreviation) !=
            abbreviations.end()) {
            result.push_back(UnitMatch{type, &unit});
        }
    }
    return result;
}

void AbbreviationResolver::mapAbbreviation(QuantityType type, const UnitInfo& unit,
                                           const std::string& culture,
                                           const std::string& abbreviation) {
    if (unit.quantity_type != type) {
        throw UnknownUnit("Unit " + unit.name + " does not belong to " + toString(type));
    }
    if (abbreviation.empty()) {
        return;
    }
    appendUnique(custom_[Key(type, unit.index, culture)], abbreviation);
}

} // namespace Quantica
