#ifndef QUANTICA_QUANTITY_PARSER_HPP
#define QUANTICA_QUANTITY_PARSER_HPP

#include "AbbreviationResolver.hpp"
#include "CompositeGrammar.hpp"
#include "NumberFormat.hpp"
#include "PatternBuilder.hpp"
#include "PatternCache.hpp"
#include "Quantity.hpp"
#include "QuantityErrors.hpp"
#include <memory>
#include <string>

namespace Quantica {

/**
 * @brief Parses "<number> <abbreviation>" text into quantities
 *
 * Single-unit parsing tries every unit of the requested type in
 * declaration order and keeps the first match, so an abbreviation shared
 * by two units ("ton") always resolves to the unit declared first. When no
 * single unit matches, the composite grammars registered for the type are
 * tried in registration order.
 *
 * Compiled patterns are cached for the lifetime of the parser. After
 * set-up (registerComposite, setVerbose) every method is const and safe to
 * call from several threads at once.
 */
class QuantityParser {
public:
    QuantityParser(const AbbreviationResolver& resolver, const CultureTable& cultures,
                   CompositeRegistry composites = CompositeRegistry::withBuiltins());

    // =========================================================================
    // Set-up
    // =========================================================================

    /**
     * @brief Register a composite grammar for a quantity type
     * @throws std::invalid_argument for malformed grammars or separators
     * @throws UnknownUnit if a part names a unit the type does not have
     */
    void registerComposite(QuantityType type, const CompositeGrammar& grammar);

    const CompositeRegistry& composites() const { return composites_; }

    void setVerbose(bool verbose) { verbose_ = verbose; }
    bool verbose() const { return verbose_; }

    // =========================================================================
    // Parsing
    // =========================================================================

    /**
     * @brief Parse text as a quantity of the given type
     * @param text Input such as "2.5 kg" or "2 ft 4 in"
     * @param[out] result Parsed quantity, in the unit that matched
     * @param[out] failure Optional diagnostics, filled when parsing fails
     * @return true if parsing successful
     * @throws UnknownCulture if the culture is not known
     */
    bool tryParse(const std::string& text, QuantityType type, const std::string& culture,
                  Quantity& result, ParseFailure* failure = nullptr) const;

    /**
     * @throws FormatException if the text does not parse
     */
    Quantity parse(const std::string& text, QuantityType type,
                   const std::string& culture) const;

    /**
     * @brief Parse using the composite grammars only
     *
     * The result is expressed in the unit of the grammar's first part.
     */
    bool tryParseComposite(const std::string& text, QuantityType type,
                           const std::string& culture, Quantity& result,
                           ParseFailure* failure = nullptr) const;

    Quantity parseComposite(const std::string& text, QuantityType type,
                            const std::string& culture) const;

    /**
     * @brief Parse a bare abbreviation ("kg") to a unit of the given type
     * @return The first declared unit with that abbreviation, or nullptr
     */
    const UnitInfo* tryParseUnit(const std::string& abbreviation, QuantityType type,
                                 const std::string& culture) const;

    /**
     * @throws FormatException if no unit of the type has the abbreviation
     */
    const UnitInfo& parseUnit(const std::string& abbreviation, QuantityType type,
                              const std::string& culture) const;

    size_t cachedPatterns() const { return cache_.size(); }

private:
    std::shared_ptr<const ParsePattern> unitPattern(QuantityType type, const UnitInfo& unit,
                                                    const std::string& culture) const;

    std::shared_ptr<const ParsePattern> compositePattern(QuantityType type,
                                                         const CompositeGrammar& grammar,
                                                         const std::string& culture) const;

    // Match trimmed text against the anchored pattern of one unit
    bool matchUnit(const std::string& text, QuantityType type, const UnitInfo& unit,
                   const std::string& culture, Quantity& result,
                   ParseFailure& failure) const;

    bool parseSingleUnit(const std::string& text, QuantityType type,
                         const std::string& culture, Quantity& result,
                         ParseFailure& failure) const;

    bool parseCompositeText(const std::string& text, QuantityType type,
                            const std::string& culture, Quantity& result,
                            ParseFailure& failure) const;

    void debug(const std::string& message) const;

    const AbbreviationResolver& resolver_;
    const CultureTable& cultures_;
    PatternBuilder builder_;
    CompositeRegistry composites_;
    mutable PatternCache cache_;
    bool verbose_ = false;
};

} // namespace Quantica

#endif // QUANTICA_QUANTITY_PARSER_HPP
