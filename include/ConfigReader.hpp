#ifndef QUANTICA_CONFIG_READER_HPP
#define QUANTICA_CONFIG_READER_HPP

#include "QuantityEngine.hpp"
#include <istream>
#include <map>
#include <string>
#include <vector>

namespace Quantica {

/**
 * @brief INI-style configuration reader
 *
 * Configures a QuantityEngine from a text file:
 *
 *   [engine]
 *   default_culture = en-US
 *   fallback_culture = en-US
 *   division_by_zero = throw        # throw | ieee754
 *   verbose = false
 *   builtin_composites = true
 *
 *   [abbreviations.en-US]
 *   Length.Foot = feet, foot
 *
 *   [composite.Mass]
 *   StonePounds = Stone, Pound
 *   StonePounds.separator = \s?
 */
class ConfigReader {
public:
    struct ValidationResult {
        bool valid;
        std::vector<std::string> errors;
        std::vector<std::string> warnings;
    };

    ConfigReader();
    ~ConfigReader() = default;

    // Load configuration file
    bool loadFile(const std::string& filename);

    // Load configuration from text, e.g. an embedded default
    bool loadString(const std::string& content);

    // =========================================================================
    // Engine Configuration
    // =========================================================================

    /**
     * @brief Fill an engine configuration from [engine], [abbreviations.*]
     * and [composite.*]
     *
     * Entries naming unknown cultures, quantity types or units are reported
     * as warnings and skipped.
     * @return true if any engine section was present
     */
    bool parseEngineConfig(EngineConfig& config) const;

    // =========================================================================
    // Value Accessors
    // =========================================================================

    std::string getString(const std::string& section, const std::string& key,
                          const std::string& default_val = "") const;
    int getInt(const std::string& section, const std::string& key,
               int default_val = 0) const;
    double getDouble(const std::string& section, const std::string& key,
                     double default_val = 0.0) const;
    bool getBool(const std::string& section, const std::string& key,
                 bool default_val = false) const;
    std::vector<std::string> getStringArray(const std::string& section,
                                            const std::string& key) const;

    // =========================================================================
    // Unit-Aware Value Accessors
    // =========================================================================

    /**
     * @brief Read a value with a unit, e.g. "length = 2 ft 4 in"
     * @param culture Culture of the text, empty for the engine default
     * @return The parsed quantity, or default_val if the key is missing or
     *         does not parse (with a warning)
     */
    Quantity getQuantity(const std::string& section, const std::string& key,
                         QuantityType type, const QuantityEngine& engine,
                         const Quantity& default_val,
                         const std::string& culture = "") const;

    /**
     * @brief Read a value with a unit and convert it to the named unit
     */
    double getDoubleWithUnit(const std::string& section, const std::string& key,
                             QuantityType type, const std::string& unit,
                             const QuantityEngine& engine, double default_val = 0.0) const;

    // =========================================================================
    // Section/Key Query Methods
    // =========================================================================

    bool hasSection(const std::string& section) const;
    bool hasKey(const std::string& section, const std::string& key) const;
    std::vector<std::string> getSections() const;
    std::vector<std::string> getKeys(const std::string& section) const;

    // =========================================================================
    // Template Generation
    // =========================================================================

    static bool generateTemplate(const std::string& filename);

    // =========================================================================
    // Utility Methods
    // =========================================================================

    std::map<std::string, std::string> getSectionData(const std::string& section) const;
    std::vector<std::string> getSectionsMatching(const std::string& prefix) const;
    bool mergeFile(const std::string& filename);
    ValidationResult validate() const;

private:
    std::map<std::string, std::map<std::string, std::string>> data;

    bool parseStream(std::istream& input);

    std::string trim(const std::string& str) const;
    std::vector<std::string> split(const std::string& str, char delim) const;

    // Each helper skips bad entries and describes them in problems
    void parseEngineSection(EngineConfig& config, std::vector<std::string>& problems) const;
    void parseAbbreviations(EngineConfig& config, std::vector<std::string>& problems) const;
    void parseComposites(EngineConfig& config, std::vector<std::string>& problems) const;
};

} // namespace Quantica

#endif // QUANTICA_CONFIG_READER_HPP
