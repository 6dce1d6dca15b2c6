#include "QuantityEngine.hpp"
#include <iostream>

namespace Quantica {

QuantityEngine::QuantityEngine(const EngineConfig& config)
    : config_(config),
      table_(UnitTable::instance()),
      cultures_(CultureTable::instance()),
      resolver_(table_, config.fallback_culture),
      parser_(resolver_, cultures_,
              config.builtin_composites ? CompositeRegistry::withBuiltins()
                                        : CompositeRegistry()),
      operators_(config.division_policy),
      formatter_(resolver_, cultures_) {
    // Both cultures must exist before anything is parsed with them
    cultures_.get(config_.default_culture);
    cultures_.get(config_.fallback_culture);

    for (const auto& mapping : config_.abbreviations) {
        cultures_.get(mapping.culture);
        const UnitInfo& unit = table_.getUnit(mapping.quantity_type, mapping.unit);
        resolver_.mapAbbreviation(mapping.quantity_type, unit, mapping.culture,
                                  mapping.abbreviation);
    }

    for (const auto& registration : config_.composites) {
        parser_.registerComposite(registration.quantity_type, registration.grammar);
    }

    parser_.setVerbose(config_.verbose);

    if (config_.verbose) {
        std::cerr << "Debug: engine ready (culture " << config_.default_culture
                  << ", fallback " << config_.fallback_culture
                  << ", division " << toString(config_.division_policy)
                  << ", " << config_.abbreviations.size() << " custom abbreviation(s), "
                  << parser_.composites().size() << " composite grammar(s))" << std::endl;
    }
}

const std::string& QuantityEngine::culture(const std::string& requested) const {
    return requested.empty() ? config_.default_culture : requested;
}

// =============================================================================
// Parsing
// =============================================================================

bool QuantityEngine::tryParse(const std::string& text, QuantityType type, Quantity& result,
                              const std::string& culture_name, ParseFailure* failure) const {
    return parser_.tryParse(text, type, culture(culture_name), result, failure);
}

Quantity QuantityEngine::parse(const std::string& text, QuantityType type,
                               const std::string& culture_name) const {
    return parser_.parse(text, type, culture(culture_name));
}

bool QuantityEngine::tryParseComposite(const std::string& text, QuantityType type,
                                       Quantity& result, const std::string& culture_name,
                                       ParseFailure* failure) const {
    return parser_.tryParseComposite(text, type, culture(culture_name), result, failure);
}

Quantity QuantityEngine::parseComposite(const std::string& text, QuantityType type,
                                        const std::string& culture_name) const {
    return parser_.parseComposite(text, type, culture(culture_name));
}

const UnitInfo* QuantityEngine::tryParseUnit(const std::string& abbreviation,
                                             QuantityType type,
                                             const std::string& culture_name) const {
    return parser_.tryParseUnit(abbreviation, type, culture(culture_name));
}

const UnitInfo& QuantityEngine::parseUnit(const std::string& abbreviation, QuantityType type,
                                          const std::string& culture_name) const {
    return parser_.parseUnit(abbreviation, type, culture(culture_name));
}

// =============================================================================
// Formatting
// =============================================================================

std::string QuantityEngine::format(const Quantity& quantity, const std::string& culture_name,
                                   int precision) const {
    return formatter_.format(quantity, culture(culture_name), precision);
}

std::string QuantityEngine::formatFeetInches(const Quantity& length,
                                             const std::string& culture_name) const {
    return formatter_.formatFeetInches(length, culture(culture_name));
}

std::vector<std::string> QuantityEngine::abbreviationsFor(QuantityType type,
                                                          const std::string& unit,
                                                          const std::string& culture_name) const {
    return resolver_.abbreviationsFor(type, table_.getUnit(type, unit), culture(culture_name));
}

} // namespace Quantica
