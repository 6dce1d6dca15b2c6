#ifndef QUANTICA_QUANTITY_ENGINE_HPP
#define QUANTICA_QUANTITY_ENGINE_HPP

#include "AbbreviationResolver.hpp"
#include "CompositeGrammar.hpp"
#include "NumberFormat.hpp"
#include "OperatorNetwork.hpp"
#include "QuantityFormatter.hpp"
#include "QuantityParser.hpp"
#include "UnitTable.hpp"
#include <limits>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief Custom abbreviation added on top of the unit table
 */
struct AbbreviationMapping {
    QuantityType quantity_type = QuantityType::LENGTH;
    std::string unit;          // Unit name, e.g. "Foot"
    std::string culture;
    std::string abbreviation;
};

struct CompositeRegistration {
    QuantityType quantity_type = QuantityType::LENGTH;
    CompositeGrammar grammar;
};

/**
 * @brief Everything needed to build a QuantityEngine
 *
 * Usually filled by ConfigReader::parseEngineConfig.
 */
struct EngineConfig {
    std::string default_culture = "en-US";     // Used when a call passes no culture
    std::string fallback_culture = "en-US";    // Abbreviation fallback
    DivisionPolicy division_policy = DivisionPolicy::THROW;
    bool verbose = false;                      // Debug traces on stderr
    bool builtin_composites = true;            // Register feet-inches for Length

    std::vector<AbbreviationMapping> abbreviations;
    std::vector<CompositeRegistration> composites;
};

/**
 * @brief Long-lived owner of the parsing and arithmetic machinery
 *
 * Construct once and share: all set-up happens in the constructor, after
 * which every method is const and thread safe. An empty culture argument
 * selects the configured default culture.
 */
class QuantityEngine {
public:
    /**
     * @throws UnknownCulture if a configured culture is not known
     * @throws UnknownUnit if a custom abbreviation or composite names an unknown unit
     * @throws std::invalid_argument for malformed composite grammars
     */
    explicit QuantityEngine(const EngineConfig& config = EngineConfig());

    QuantityEngine(const QuantityEngine&) = delete;
    QuantityEngine& operator=(const QuantityEngine&) = delete;

    // =========================================================================
    // Parsing
    // =========================================================================

    bool tryParse(const std::string& text, QuantityType type, Quantity& result,
                  const std::string& culture = "", ParseFailure* failure = nullptr) const;

    Quantity parse(const std::string& text, QuantityType type,
                   const std::string& culture = "") const;

    bool tryParseComposite(const std::string& text, QuantityType type, Quantity& result,
                           const std::string& culture = "",
                           ParseFailure* failure = nullptr) const;

    Quantity parseComposite(const std::string& text, QuantityType type,
                            const std::string& culture = "") const;

    const UnitInfo* tryParseUnit(const std::string& abbreviation, QuantityType type,
                                 const std::string& culture = "") const;

    const UnitInfo& parseUnit(const std::string& abbreviation, QuantityType type,
                              const std::string& culture = "") const;

    // =========================================================================
    // Arithmetic
    // =========================================================================

    Quantity multiply(const Quantity& left, const Quantity& right) const {
        return operators_.multiply(left, right);
    }

    Quantity divide(const Quantity& left, const Quantity& right) const {
        return operators_.divide(left, right);
    }

    // =========================================================================
    // Formatting
    // =========================================================================

    std::string format(const Quantity& quantity, const std::string& culture = "",
                       int precision = std::numeric_limits<double>::max_digits10) const;

    std::string formatFeetInches(const Quantity& length,
                                 const std::string& culture = "") const;

    /**
     * @brief Abbreviations of a unit, longest first
     * @throws UnknownUnit, AbbreviationNotFound
     */
    std::vector<std::string> abbreviationsFor(QuantityType type, const std::string& unit,
                                              const std::string& culture = "") const;

    // =========================================================================
    // Components
    // =========================================================================

    const EngineConfig& config() const { return config_; }
    const std::string& defaultCulture() const { return config_.default_culture; }
    const UnitTable& units() const { return table_; }
    const CultureTable& cultures() const { return cultures_; }
    const AbbreviationResolver& resolver() const { return resolver_; }
    const QuantityParser& parser() const { return parser_; }
    const OperatorNetwork& operators() const { return operators_; }
    const QuantityFormatter& formatter() const { return formatter_; }

private:
    const std::string& culture(const std::string& requested) const;

    EngineConfig config_;
    const UnitTable& table_;
    const CultureTable& cultures_;
    AbbreviationResolver resolver_;
    QuantityParser parser_;
    OperatorNetwork operators_;
    QuantityFormatter formatter_;
};

} // namespace Quantica

#endif // QUANTICA_QUANTITY_ENGINE_HPP
