#include "ConfigReader.hpp"
#include <algorithm>
#include <cctype>
#include <fstream>
#include <iostream>
#include <sstream>
#include <stdexcept>

namespace Quantica {

namespace {

const std::string kEngineSection = "engine";
const std::string kAbbreviationPrefix = "abbreviations.";
const std::string kCompositePrefix = "composite.";
const std::string kSeparatorSuffix = ".separator";
const std::string kDefaultSeparator = "\\s?";

bool endsWith(const std::string& str, const std::string& suffix) {
    return str.size() >= suffix.size() &&
           str.compare(str.size() - suffix.size(), suffix.size(), suffix) == 0;
}

} // namespace

ConfigReader::ConfigReader() {}

bool ConfigReader::loadFile(const std::string& filename) {
    std::ifstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot open configuration file: " << filename << std::endl;
        return false;
    }
    return parseStream(file);
}

bool ConfigReader::loadString(const std::string& content) {
    std::istringstream input(content);
    return parseStream(input);
}

bool ConfigReader::parseStream(std::istream& input) {
    std::string current_section;
    std::string line;
    int line_num = 0;

    while (std::getline(input, line)) {
        line_num++;
        line = trim(line);

        // Skip empty lines and comments
        if (line.empty() || line[0] == '#' || line[0] == ';') {
            continue;
        }

        // Check for section header [section]
        if (line[0] == '[' && line.back() == ']') {
            current_section = trim(line.substr(1, line.length() - 2));
            continue;
        }

        // Parse key = value
        size_t eq_pos = line.find('=');
        if (eq_pos == std::string::npos) {
            std::cerr << "Warning: Invalid line " << line_num << ": " << line << std::endl;
            continue;
        }

        std::string key = trim(line.substr(0, eq_pos));
        std::string value = trim(line.substr(eq_pos + 1));

        // Remove inline comments: a '#' after whitespace. A '#' inside a
        // value (an abbreviation, a separator regex) is kept.
        for (size_t pos = 1; pos < value.size(); ++pos) {
            if (value[pos] == '#' && (value[pos - 1] == ' ' || value[pos - 1] == '\t')) {
                value = trim(value.substr(0, pos));
                break;
            }
        }

        if (current_section.empty()) {
            std::cerr << "Warning: Key without section at line " << line_num << std::endl;
            continue;
        }

        data[current_section][key] = value;
    }

    return true;
}

std::string ConfigReader::trim(const std::string& str) const {
    size_t first = str.find_first_not_of(" \t\r\n");
    if (first == std::string::npos) return "";

    size_t last = str.find_last_not_of(" \t\r\n");
    return str.substr(first, last - first + 1);
}

std::vector<std::string> ConfigReader::split(const std::string& str, char delim) const {
    std::vector<std::string> result;
    std::stringstream ss(str);
    std::string item;

    while (std::getline(ss, item, delim)) {
        item = trim(item);
        if (!item.empty()) {
            result.push_back(item);
        }
    }

    return result;
}

// =============================================================================
// Value Accessors
// =============================================================================

std::string ConfigReader::getString(const std::string& section, const std::string& key,
                                    const std::string& default_val) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return default_val;

    auto key_it = sec_it->second.find(key);
    if (key_it == sec_it->second.end()) return default_val;

    return key_it->second;
}

int ConfigReader::getInt(const std::string& section, const std::string& key,
                         int default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stoi(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as integer" << std::endl;
        return default_val;
    }
}

double ConfigReader::getDouble(const std::string& section, const std::string& key,
                               double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    try {
        return std::stod(val);
    } catch (const std::exception&) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key
                  << " = '" << val << "' as double" << std::endl;
        return default_val;
    }
}

bool ConfigReader::getBool(const std::string& section, const std::string& key,
                           bool default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) return default_val;

    std::transform(val.begin(), val.end(), val.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });

    if (val == "true" || val == "yes" || val == "1" || val == "on") return true;
    if (val == "false" || val == "no" || val == "0" || val == "off") return false;

    return default_val;
}

std::vector<std::string> ConfigReader::getStringArray(const std::string& section,
                                                      const std::string& key) const {
    return split(getString(section, key), ',');
}

// =============================================================================
// Unit-Aware Value Accessors
// =============================================================================

Quantity ConfigReader::getQuantity(const std::string& section, const std::string& key,
                                   QuantityType type, const QuantityEngine& engine,
                                   const Quantity& default_val,
                                   const std::string& culture) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    Quantity result;
    ParseFailure failure;
    if (!engine.tryParse(val, type, result, culture, &failure)) {
        std::cerr << "Warning: Cannot parse [" << section << "]:" << key << " = '"
                  << val << "' as " << toString(type) << std::endl;
        return default_val;
    }
    return result;
}

double ConfigReader::getDoubleWithUnit(const std::string& section, const std::string& key,
                                       QuantityType type, const std::string& unit,
                                       const QuantityEngine& engine, double default_val) const {
    std::string val = getString(section, key);
    if (val.empty()) {
        return default_val;
    }

    const UnitInfo& target = engine.units().getUnit(type, unit);

    // A bare number is taken to be in the requested unit
    double plain = 0.0;
    if (engine.cultures().get(engine.defaultCulture()).tryParse(val, plain)) {
        return plain;
    }

    Quantity parsed;
    if (!engine.tryParse(val, type, parsed)) {
        std::cerr << "Warning: Unit conversion error for [" << section
                  << "]:" << key << " - cannot parse '" << val << "' as "
                  << toString(type) << std::endl;
        return default_val;
    }
    return parsed.as(target);
}

// =============================================================================
// Section/Key Query Methods
// =============================================================================

bool ConfigReader::hasSection(const std::string& section) const {
    return data.find(section) != data.end();
}

bool ConfigReader::hasKey(const std::string& section, const std::string& key) const {
    auto sec_it = data.find(section);
    if (sec_it == data.end()) return false;
    return sec_it->second.find(key) != sec_it->second.end();
}

std::vector<std::string> ConfigReader::getSections() const {
    std::vector<std::string> sections;
    for (const auto& pair : data) {
        sections.push_back(pair.first);
    }
    return sections;
}

std::vector<std::string> ConfigReader::getKeys(const std::string& section) const {
    std::vector<std::string> keys;
    auto it = data.find(section);
    if (it != data.end()) {
        for (const auto& pair : it->second) {
            keys.push_back(pair.first);
        }
    }
    return keys;
}

// =============================================================================
// Engine Configuration
// =============================================================================

void ConfigReader::parseEngineSection(EngineConfig& config,
                                      std::vector<std::string>& problems) const {
    if (!hasSection(kEngineSection)) return;

    const CultureTable& cultures = CultureTable::instance();

    std::string culture = getString(kEngineSection, "default_culture", config.default_culture);
    if (cultures.has(culture)) {
        config.default_culture = culture;
    } else {
        problems.push_back("Unknown default_culture '" + culture + "'");
    }

    culture = getString(kEngineSection, "fallback_culture", config.fallback_culture);
    if (cultures.has(culture)) {
        config.fallback_culture = culture;
    } else {
        problems.push_back("Unknown fallback_culture '" + culture + "'");
    }

    if (hasKey(kEngineSection, "division_by_zero")) {
        try {
            config.division_policy =
                parseDivisionPolicy(getString(kEngineSection, "division_by_zero"));
        } catch (const std::invalid_argument& e) {
            problems.push_back(e.what());
        }
    }

    config.verbose = getBool(kEngineSection, "verbose", config.verbose);
    config.builtin_composites = getBool(kEngineSection, "builtin_composites",
                                        config.builtin_composites);
}

void ConfigReader::parseAbbreviations(EngineConfig& config,
                                      std::vector<std::string>& problems) const {
    const CultureTable& cultures = CultureTable::instance();
    const UnitTable& table = UnitTable::instance();

    for (const auto& section : getSectionsMatching(kAbbreviationPrefix)) {
        const std::string culture = section.substr(kAbbreviationPrefix.size());
        if (!cultures.has(culture)) {
            problems.push_back("[" + section + "]: unknown culture '" + culture + "'");
            continue;
        }

        for (const auto& entry : getSectionData(section)) {
            // Key is QuantityType.Unit
            size_t dot = entry.first.find('.');
            if (dot == std::string::npos) {
                problems.push_back("[" + section + "]: expected QuantityType.Unit, got '" +
                                   entry.first + "'");
                continue;
            }

            QuantityType type;
            try {
                type = parseQuantityType(entry.first.substr(0, dot));
            } catch (const UnknownQuantityType& e) {
                problems.push_back("[" + section + "]: " + e.what());
                continue;
            }

            const UnitInfo* unit = table.findUnit(type, entry.first.substr(dot + 1));
            if (!unit) {
                problems.push_back("[" + section + "]: unknown unit '" + entry.first + "'");
                continue;
            }

            for (const auto& abbreviation : split(entry.second, ',')) {
                config.abbreviations.push_back({type, unit->name, culture, abbreviation});
            }
        }
    }
}

void ConfigReader::parseComposites(EngineConfig& config,
                                   std::vector<std::string>& problems) const {
    const UnitTable& table = UnitTable::instance();

    for (const auto& section : getSectionsMatching(kCompositePrefix)) {
        QuantityType type;
        try {
            type = parseQuantityType(section.substr(kCompositePrefix.size()));
        } catch (const UnknownQuantityType& e) {
            problems.push_back("[" + section + "]: " + e.what());
            continue;
        }

        const auto entries = getSectionData(section);
        for (const auto& entry : entries) {
            if (endsWith(entry.first, kSeparatorSuffix)) continue;

            CompositeGrammar grammar;
            grammar.name = entry.first;
            const std::string separator =
                getString(section, entry.first + kSeparatorSuffix, kDefaultSeparator);

            bool valid = true;
            for (const auto& unit_name : split(entry.second, ',')) {
                const UnitInfo* unit = table.findUnit(type, unit_name);
                if (!unit) {
                    problems.push_back("[" + section + "]: " + grammar.name +
                                       " names unknown unit '" + unit_name + "'");
                    valid = false;
                    break;
                }
                grammar.parts.push_back({unit->name, separator});
            }
            if (!valid) continue;

            if (grammar.parts.size() < 2) {
                problems.push_back("[" + section + "]: " + grammar.name +
                                   " needs at least two units");
                continue;
            }
            grammar.parts.back().separator.clear();

            config.composites.push_back({type, grammar});
        }
    }
}

bool ConfigReader::parseEngineConfig(EngineConfig& config) const {
    std::vector<std::string> problems;
    parseEngineSection(config, problems);
    parseAbbreviations(config, problems);
    parseComposites(config, problems);

    for (const auto& problem : problems) {
        std::cerr << "Warning: " << problem << " (skipped)" << std::endl;
    }

    return hasSection(kEngineSection) ||
           !getSectionsMatching(kAbbreviationPrefix).empty() ||
           !getSectionsMatching(kCompositePrefix).empty();
}

// =============================================================================
// Template Generation
// =============================================================================

bool ConfigReader::generateTemplate(const std::string& filename) {
    std::ofstream file(filename);
    if (!file.is_open()) {
        std::cerr << "Error: Cannot write template file: " << filename << std::endl;
        return false;
    }

    file << "# Quantica engine configuration\n";
    file << "# Comments start with '#' at the line start or after whitespace;\n";
    file << "# a '#' inside a value is part of the value\n\n";
    file << "[engine]\n";
    file << "default_culture = en-US\n";
    file << "fallback_culture = en-US\n";
    file << "division_by_zero = throw        # throw | ieee754\n";
    file << "verbose = false\n";
    file << "builtin_composites = true       # feet-inches for Length\n\n";
    file << "# Extra abbreviations: QuantityType.Unit = abbr, abbr\n";
    file << "[abbreviations.en-US]\n";
    file << "Length.Foot = feet, foot\n";
    file << "Length.Inch = inches, inch\n\n";
    file << "# Composite formats: Name = Unit, Unit[, Unit...]\n";
    file << "[composite.Mass]\n";
    file << "StonePounds = Stone, Pound\n";
    file << "StonePounds.separator = \\s?\n";

    return true;
}

// =============================================================================
// Utility Methods
// =============================================================================

std::map<std::string, std::string> ConfigReader::getSectionData(const std::string& section) const {
    auto it = data.find(section);
    if (it != data.end()) {
        return it->second;
    }
    return {};
}

std::vector<std::string> ConfigReader::getSectionsMatching(const std::string& prefix) const {
    std::vector<std::string> result;
    for (const auto& pair : data) {
        if (pair.first.find(prefix) == 0) {
            result.push_back(pair.first);
        }
    }
    return result;
}

bool ConfigReader::mergeFile(const std::string& filename) {
    ConfigReader other;
    if (!other.loadFile(filename)) {
        return false;
    }

    // Merge data - other file values override existing
    for (const auto& section : other.data) {
        for (const auto& key_val : section.second) {
            data[section.first][key_val.first] = key_val.second;
        }
    }

    return true;
}

ConfigReader::ValidationResult ConfigReader::validate() const {
    ValidationResult result;
    result.valid = true;

    if (!hasSection(kEngineSection)) {
        result.warnings.push_back("No [engine] section found - using defaults");
    }

    for (const auto& section : getSections()) {
        if (section != kEngineSection &&
            section.find(kAbbreviationPrefix) != 0 &&
            section.find(kCompositePrefix) != 0) {
            result.warnings.push_back("Unrecognized section [" + section + "]");
        }
    }

    EngineConfig config;
    std::vector<std::string> problems;
    parseEngineSection(config, problems);
    parseAbbreviations(config, problems);
    parseComposites(config, problems);

    for (const auto& problem : problems) {
        result.errors.push_back(problem);
    }

    result.valid = result.errors.empty();
    return result;
}

} // namespace Quantica
