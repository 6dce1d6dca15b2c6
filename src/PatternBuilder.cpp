#include "PatternBuilder.hpp"
#include "QuantityErrors.hpp"
#include <cstring>

namespace Quantica {

PatternBuilder::PatternBuilder(const AbbreviationResolver& resolver,
                               const CultureTable& cultures)
    : resolver_(resolver), cultures_(cultures) {}

std::string PatternBuilder::escape(const std::string& literal) {
    static const char* const kMetacharacters = "\\^$.|?*+()[]{}/-#&~";

    std::string escaped;
    escaped.reserve(literal.size() * 2);
    for (char c : literal) {
        if (c == ' ') {
            escaped += "\\s";
        } else if (c != '\0' && std::strchr(kMetacharacters, c) != nullptr) {
            escaped += '\\';
            escaped += c;
        } else {
            // Bytes of multi-byte UTF-8 sequences are never metacharacters
            escaped += c;
        }
    }
    return escaped;
}

std::string PatternBuilder::alternation(const std::vector<std::string>& literals) {
    std::string result;
    for (size_t i = 0; i < literals.size(); ++i) {
        if (i > 0) result += '|';
        result += escape(literals[i]);
    }
    return result;
}

std::string PatternBuilder::numberPattern(const NumberFormat& format) {
    // Sign: ASCII forms always, plus the culture's own minus sign
    std::string sign = "[+-]";
    if (format.negativeSign() != "-") {
        sign = "(?:[+-]|" + escape(format.negativeSign()) + ")";
    }

    const std::string decimal = escape(format.decimalSeparator());

    std::string integer = "\\d+";
    if (format.hasGrouping()) {
        integer = "(?:\\d{1,3}(?:" + escape(format.groupSeparator()) + "\\d{3})+|\\d+)";
    }

    return sign + "?" +
           "(?:" + integer + "(?:" + decimal + "\\d*)?|" + decimal + "\\d+)" +
           "(?:[eE][+-]?\\d+)?";
}

std::string PatternBuilder::buildUnitPattern(QuantityType type, const UnitInfo& unit,
                                             const std::string& culture,
                                             bool match_entire_string) const {
    const NumberFormat& format = cultures_.get(culture);

    std::vector<std::string> abbreviations;
    try {
        abbreviations = resolver_.abbreviationsFor(type, unit, culture);
    } catch (const AbbreviationNotFound&) {
        throw NoAbbreviationsForUnit(type, unit.name, culture);
    }

    const std::string number = numberPattern(format);
    const std::string units = alternation(abbreviations);

    if (match_entire_string) {
        return "^\\s*(?<value>" + number + ")\\s?(?<unit>" + units + ")\\s*$";
    }
    return "(?:" + number + ")\\s?(?:" + units + ")";
}

} // namespace Quantica
