#include "QuantityParser.hpp"
#include <iostream>
#include <stdexcept>
#include <utility>

namespace Quantica {

namespace {

std::string trim(const std::string& str) {
    const char* whitespace = " \t\n\r\f\v";
    size_t first = str.find_first_not_of(whitespace);
    if (first == std::string::npos) return "";
    size_t last = str.find_last_not_of(whitespace);
    return str.substr(first, last - first + 1);
}

void resetFailure(ParseFailure& failure, const std::string& text, QuantityType type,
                  const std::string& culture) {
    failure.text = text;
    failure.quantity_type = type;
    failure.culture = culture;
    failure.attempts.clear();
}

} // namespace

QuantityParser::QuantityParser(const AbbreviationResolver& resolver,
                               const CultureTable& cultures,
                               CompositeRegistry composites)
    : resolver_(resolver),
      cultures_(cultures),
      builder_(resolver, cultures),
      composites_(std::move(composites)) {}

void QuantityParser::registerComposite(QuantityType type, const CompositeGrammar& grammar) {
    for (const auto& part : grammar.parts) {
        if (part.separator.empty()) continue;
        try {
            boost::regex check(part.separator, boost::regex::perl);
        } catch (const boost::regex_error& e) {
            throw std::invalid_argument("Invalid separator '" + part.separator +
                                        "' in composite grammar " + grammar.name +
                                        ": " + e.what());
        }
    }
    composites_.add(type, grammar, resolver_.table());
}

void QuantityParser::debug(const std::string& message) const {
    if (verbose_) {
        std::cerr << "Debug: " << message << std::endl;
    }
}

// =============================================================================
// Pattern Cache Access
// =============================================================================

std::shared_ptr<const ParsePattern> QuantityParser::unitPattern(QuantityType type,
                                                                const UnitInfo& unit,
                                                                const std::string& culture) const {
    const std::string key = PatternCache::makeKey(type, unit.name, culture, true);
    return cache_.getOrCreate(key, [&]() {
        auto pattern = std::make_shared<ParsePattern>();
        pattern->key = key;
        pattern->source = builder_.buildUnitPattern(type, unit, culture, true);
        pattern->regex.assign(pattern->source, boost::regex::perl);
        pattern->quantity_type = type;
        pattern->unit = &unit;
        debug("compiled " + key + " -> " + pattern->source);
        return std::shared_ptr<const ParsePattern>(pattern);
    });
}

std::shared_ptr<const ParsePattern> QuantityParser::compositePattern(
    QuantityType type, const CompositeGrammar& grammar, const std::string& culture) const {
    const std::string key = PatternCache::makeKey(type, "composite:" + grammar.name,
                                                  culture, true);
    return cache_.getOrCreate(key, [&]() {
        const UnitTable& table = resolver_.table();

        std::string source = "^\\s*";
        for (size_t i = 0; i < grammar.parts.size(); ++i) {
            const CompositePart& part = grammar.parts[i];
            const UnitInfo& unit = table.getUnit(type, part.unit);
            source += "(?<p" + std::to_string(i) + ">" +
                      builder_.buildUnitPattern(type, unit, culture, false) + ")";
            if (i + 1 < grammar.parts.size() && !part.separator.empty()) {
                source += "(?:" + part.separator + ")";
            }
        }
        source += "\\s*$";

        auto pattern = std::make_shared<ParsePattern>();
        pattern->key = key;
        pattern->source = source;
        pattern->regex.assign(source, boost::regex::perl);
        pattern->quantity_type = type;
        pattern->grammar = grammar.name;
        debug("compiled " + key + " -> " + source);
        return std::shared_ptr<const ParsePattern>(pattern);
    });
}

// =============================================================================
// Matching
// =============================================================================

bool QuantityParser::matchUnit(const std::string& text, QuantityType type,
                               const UnitInfo& unit, const std::string& culture,
                               Quantity& result, ParseFailure& failure) const {
    std::shared_ptr<const ParsePattern> pattern;
    try {
        pattern = unitPattern(type, unit, culture);
    } catch (const NoAbbreviationsForUnit& e) {
        failure.attempts.push_back({unit.name, "", e.what()});
        debug("skipping " + unit.name + ": " + e.what());
        return false;
    }
    failure.attempts.push_back({unit.name, pattern->source, ""});

    boost::smatch match;
    if (!boost::regex_match(text, match, pattern->regex)) {
        return false;
    }

    const std::string number = match["value"].str();
    double value = 0.0;
    if (!cultures_.get(culture).tryParse(number, value)) {
        failure.attempts.back().note = "'" + number + "' is not a number in " + culture;
        return false;
    }

    result = Quantity(value, unit);
    return true;
}

bool QuantityParser::parseSingleUnit(const std::string& text, QuantityType type,
                                     const std::string& culture, Quantity& result,
                                     ParseFailure& failure) const {
    // First declared unit wins when abbreviations overlap
    for (const auto& unit : resolver_.table().units(type)) {
        if (matchUnit(text, type, unit, culture, result, failure)) {
            return true;
        }
    }
    return false;
}

bool QuantityParser::parseCompositeText(const std::string& text, QuantityType type,
                                        const std::string& culture, Quantity& result,
                                        ParseFailure& failure) const {
    const UnitTable& table = resolver_.table();

    for (const auto& grammar : composites_.grammarsFor(type)) {
        std::shared_ptr<const ParsePattern> pattern;
        try {
            pattern = compositePattern(type, grammar, culture);
        } catch (const NoAbbreviationsForUnit& e) {
            failure.attempts.push_back({grammar.name, "", e.what()});
            debug("skipping composite " + grammar.name + ": " + e.what());
            continue;
        }
        failure.attempts.push_back({grammar.name, pattern->source, ""});

        boost::smatch match;
        if (!boost::regex_match(text, match, pattern->regex)) {
            continue;
        }

        // Each part is parsed on its own, so a leading sign stays with the first part
        Quantity total;
        bool parsed = true;
        for (size_t i = 0; i < grammar.parts.size(); ++i) {
            const UnitInfo& unit = table.getUnit(type, grammar.parts[i].unit);
            const std::string part_text = match["p" + std::to_string(i)].str();

            ParseFailure part_failure;
            Quantity part;
            if (!matchUnit(part_text, type, unit, culture, part, part_failure)) {
                failure.attempts.back().note = "part '" + part_text + "' is not a valid " +
                                               unit.name;
                parsed = false;
                break;
            }
            total = (i == 0) ? part : total + part;
        }

        if (parsed) {
            result = total;
            return true;
        }
    }
    return false;
}

// =============================================================================
// Public Interface
// =============================================================================

bool QuantityParser::tryParse(const std::string& text, QuantityType type,
                              const std::string& culture, Quantity& result,
                              ParseFailure* failure) const {
    ParseFailure local;
    ParseFailure& diagnostics = failure ? *failure : local;
    resetFailure(diagnostics, text, type, culture);

    cultures_.get(culture);

    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        debug("empty input for " + toString(type));
        return false;
    }

    if (parseSingleUnit(trimmed, type, culture, result, diagnostics)) {
        return true;
    }
    return parseCompositeText(trimmed, type, culture, result, diagnostics);
}

Quantity QuantityParser::parse(const std::string& text, QuantityType type,
                               const std::string& culture) const {
    ParseFailure failure;
    Quantity result;
    if (!tryParse(text, type, culture, result, &failure)) {
        throw FormatException(failure.describe(), failure);
    }
    return result;
}

bool QuantityParser::tryParseComposite(const std::string& text, QuantityType type,
                                       const std::string& culture, Quantity& result,
                                       ParseFailure* failure) const {
    ParseFailure local;
    ParseFailure& diagnostics = failure ? *failure : local;
    resetFailure(diagnostics, text, type, culture);

    cultures_.get(culture);

    const std::string trimmed = trim(text);
    if (trimmed.empty()) {
        return false;
    }
    return parseCompositeText(trimmed, type, culture, result, diagnostics);
}

Quantity QuantityParser::parseComposite(const std::string& text, QuantityType type,
                                        const std::string& culture) const {
    ParseFailure failure;
    Quantity result;
    if (!tryParseComposite(text, type, culture, result, &failure)) {
        throw FormatException(failure.describe(), failure);
    }
    return result;
}

const UnitInfo* QuantityParser::tryParseUnit(const std::string& abbreviation,
                                             QuantityType type,
                                             const std::string& culture) const {
    cultures_.get(culture);

    const std::string trimmed = trim(abbreviation);
    if (trimmed.empty()) {
        return nullptr;
    }

    auto matches = resolver_.unitsFor(trimmed, type, culture);
    if (matches.empty()) {
        return nullptr;
    }
    return matches.front().unit;
}

const UnitInfo& QuantityParser::parseUnit(const std::string& abbreviation, QuantityType type,
                                          const std::string& culture) const {
    const UnitInfo* unit = tryParseUnit(abbreviation, type, culture);
    if (!unit) {
        ParseFailure failure;
        resetFailure(failure, abbreviation, type, culture);
        failure.attempts.push_back({toString(type), "", "no unit with this abbreviation"});
        throw FormatException(failure.describe(), failure);
    }
    return *unit;
}

} // namespace Quantica
