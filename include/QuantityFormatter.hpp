#ifndef QUANTICA_QUANTITY_FORMATTER_HPP
#define QUANTICA_QUANTITY_FORMATTER_HPP

#include "AbbreviationResolver.hpp"
#include "NumberFormat.hpp"
#include "Quantity.hpp"
#include <limits>
#include <string>

namespace Quantica {

/**
 * @brief Renders quantities as "<number> <abbreviation>" in a culture
 *
 * The output uses the unit's default abbreviation and the culture's number
 * format, so it parses back to the same unit and value.
 */
class QuantityFormatter {
public:
    QuantityFormatter(const AbbreviationResolver& resolver, const CultureTable& cultures);

    /**
     * @brief Format a quantity in its own unit
     * @param precision Significant digits (default: enough for an exact round trip)
     * @throws AbbreviationNotFound if the unit has no abbreviation in the culture
     * @throws UnknownCulture
     */
    std::string format(const Quantity& quantity, const std::string& culture,
                       int precision = std::numeric_limits<double>::max_digits10) const;

    /**
     * @brief Format a length as "5 ft 4 in", inches rounded to whole numbers
     *
     * Only the feet carry a sign: -20 in is written "-2 ft 4 in", which
     * parses back as -(2 ft) + 4 in.
     * @throws DimensionMismatch if the quantity is not a Length
     */
    std::string formatFeetInches(const Quantity& length, const std::string& culture) const;

private:
    const AbbreviationResolver& resolver_;
    const CultureTable& cultures_;
};

} // namespace Quantica

#endif // QUANTICA_QUANTITY_FORMATTER_HPP
