#include "QuantityFormatter.hpp"
#include <cmath>

namespace Quantica {

QuantityFormatter::QuantityFormatter(const AbbreviationResolver& resolver,
                                     const CultureTable& cultures)
    : resolver_(resolver), cultures_(cultures) {}

std::string QuantityFormatter::format(const Quantity& quantity, const std::string& culture,
                                      int precision) const {
    const NumberFormat& number_format = cultures_.get(culture);
    const std::string abbreviation =
        resolver_.defaultAbbreviation(quantity.type(), quantity.unit(), culture);
    return number_format.format(quantity.value(), precision) + " " + abbreviation;
}

std::string QuantityFormatter::formatFeetInches(const Quantity& length,
                                                const std::string& culture) const {
    const NumberFormat& number_format = cultures_.get(culture);
    const UnitTable& table = resolver_.table();

    // Inches are never negative, so only the feet carry a sign and the
    // text reads back as feet + inches
    FeetInches parts = toFeetInches(length);
    double feet = parts.feet;
    double inches = std::round(parts.inches);
    if (inches >= 12.0) {
        feet += 1.0;
        inches -= 12.0;
    }
    if (feet == 0.0) {
        feet = 0.0;  // no "-0 ft"
    }

    const std::string foot = resolver_.defaultAbbreviation(
        QuantityType::LENGTH, table.getUnit(QuantityType::LENGTH, "Foot"), culture);
    const std::string inch = resolver_.defaultAbbreviation(
        QuantityType::LENGTH, table.getUnit(QuantityType::LENGTH, "Inch"), culture);

    return number_format.format(feet) + " " + foot + " " +
           number_format.format(inches) + " " + inch;
}

} // namespace Quantica
