#ifndef QUANTICA_ABBREVIATION_RESOLVER_HPP
#define QUANTICA_ABBREVIATION_RESOLVER_HPP

#include "UnitTable.hpp"
#include <map>
#include <string>
#include <tuple>
#include <vector>

namespace Quantica {

/**
 * @brief A (quantity type, unit) pair found by reverse lookup
 */
struct UnitMatch {
    QuantityType quantity_type;
    const UnitInfo* unit;
};

/**
 * @brief Resolves localized abbreviations for units, and units for
 * abbreviations
 *
 * Prefixed units get their abbreviations by combining the prefix symbol of
 * the culture with each abbreviation of the unit they derive from
 * ("k" + "g" = "kg", "к" + "г" = "кг"). When a culture defines nothing for
 * a unit the fallback culture is used instead.
 *
 * Custom abbreviations may be mapped while the engine is being set up;
 * afterwards the resolver is read-only and safe to share between threads.
 */
class AbbreviationResolver {
public:
    explicit AbbreviationResolver(const UnitTable& table,
                                  const std::string& fallback_culture = "en-US");

    /**
     * @brief All abbreviations of a unit in a culture, longest first
     * @throws AbbreviationNotFound if neither the culture nor the fallback
     *         culture has an abbreviation for the unit
     */
    std::vector<std::string> abbreviationsFor(QuantityType type, const UnitInfo& unit,
                                              const std::string& culture) const;

    /**
     * @brief The preferred (first declared) abbreviation, used for display
     * @throws AbbreviationNotFound as abbreviationsFor
     */
    std::string defaultAbbreviation(QuantityType type, const UnitInfo& unit,
                                    const std::string& culture) const;

    /**
     * @brief Units denoted by an abbreviation in a culture
     *
     * Every (quantity type, unit) appears at most once, in table
     * declaration order. Empty if the abbreviation is unknown.
     */
    std::vector<UnitMatch> unitsFor(const std::string& abbreviation,
                                    const std::string& culture) const;

    /**
     * @brief Same as unitsFor, restricted to one quantity type
     */
    std::vector<UnitMatch> unitsFor(const std::string& abbreviation,
                                    QuantityType type,
                                    const std::string& culture) const;

    /**
     * @brief Add a custom abbreviation for a unit in a culture
     *
     * Set-up only: must not be called once the resolver is shared.
     * Custom abbreviations are preferred over table abbreviations for
     * display only when the unit had none in that culture.
     */
    void mapAbbreviation(QuantityType type, const UnitInfo& unit,
                         const std::string& culture, const std::string& abbreviation);

    const std::string& fallbackCulture() const { return fallback_culture_; }
    const UnitTable& table() const { return table_; }

private:
    using Key = std::tuple<QuantityType, std::size_t, std::string>;

    // Abbreviations declared for the unit itself in exactly this culture,
    // table entries first, then custom ones
    std::vector<std::string> declared(const UnitInfo& unit, const std::string& culture) const;

    // Declaration order, no fallback, may be empty
    std::vector<std::string> collect(const UnitInfo& unit, const std::string& culture) const;

    // Declaration order, with fallback
    std::vector<std::string> resolve(QuantityType type, const UnitInfo& unit,
                                     const std::string& culture) const;

    const UnitTable& table_;
    std::string fallback_culture_;
    std::map<Key, std::vector<std::string>> custom_;
};

} // namespace Quantica

#endif // QUANTICA_ABBREVIATION_RESOLVER_HPP
