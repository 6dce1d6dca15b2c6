#ifndef QUANTICA_PATTERN_BUILDER_HPP
#define QUANTICA_PATTERN_BUILDER_HPP

#include "AbbreviationResolver.hpp"
#include "NumberFormat.hpp"
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief Builds regular expression sources that match "<number> <unit>"
 *
 * Patterns use Perl syntax as understood by Boost.Regex. Anchored patterns
 * expose two named groups, "value" and "unit". Non-anchored fragments use
 * only non-capturing groups so they can be embedded any number of times in
 * a larger pattern.
 */
class PatternBuilder {
public:
    PatternBuilder(const AbbreviationResolver& resolver, const CultureTable& cultures);

    /**
     * @brief Pattern for one unit in one culture
     * @param match_entire_string Anchor with ^...$ and capture value/unit
     * @throws NoAbbreviationsForUnit if the unit has nothing to match
     * @throws UnknownCulture if the culture is not known
     */
    std::string buildUnitPattern(QuantityType type, const UnitInfo& unit,
                                 const std::string& culture,
                                 bool match_entire_string) const;

    /**
     * @brief Number pattern for a culture (sign, grouping, decimals, exponent)
     */
    static std::string numberPattern(const NumberFormat& format);

    /**
     * @brief Escape regex metacharacters in literal text
     */
    static std::string escape(const std::string& literal);

    /**
     * @brief Escaped alternation of literals, in the given order
     */
    static std::string alternation(const std::vector<std::string>& literals);

private:
    const AbbreviationResolver& resolver_;
    const CultureTable& cultures_;
};

} // namespace Quantica

#endif // QUANTICA_PATTERN_BUILDER_HPP
