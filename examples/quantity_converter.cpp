/**
 * @file quantity_converter.cpp
 * @brief Command-line front end for the Quantica engine
 *
 * Parses a localized quantity string and optionally converts it to another
 * unit of the same quantity type.
 *
 * Usage:
 *   ./quantity_converter <text> <QuantityType> [to_unit] [--culture C] [--config file]
 *   ./quantity_converter --list [QuantityType] [--culture C]
 *   ./quantity_converter --template <file>
 *   ./quantity_converter --help
 *
 * Examples:
 *   ./quantity_converter "2.5 kg" Mass lb
 *   ./quantity_converter "2' 4\"" Length Meter
 *   ./quantity_converter "1,5 км" Length mi --culture ru-RU
 *   ./quantity_converter --list Speed
 */

#include "Quantica.hpp"
#include <cstring>
#include <iomanip>
#include <iostream>
#include <string>
#include <vector>

using namespace Quantica;

void printHelp() {
    std::cout << "\n";
    std::cout << "Quantica Quantity Converter\n";
    std::cout << "===========================\n\n";
    std::cout << "Usage:\n";
    std::cout << "  quantity_converter <text> <QuantityType> [to_unit] [--culture C] [--config file]\n";
    std::cout << "  quantity_converter --list [QuantityType] [--culture C]\n";
    std::cout << "  quantity_converter --template <file>\n";
    std::cout << "  quantity_converter --help\n\n";
    std::cout << "Examples:\n";
    std::cout << "  quantity_converter \"2.5 kg\" Mass lb\n";
    std::cout << "  quantity_converter \"2' 4\\\"\" Length Meter\n";
    std::cout << "  quantity_converter \"1,5 км\" Length mi --culture ru-RU\n";
    std::cout << "  quantity_converter \"60 mph\" Speed km/h\n";
    std::cout << "  quantity_converter --list Speed\n\n";
    std::cout << "Quantity types:\n ";
    for (QuantityType type : kAllQuantityTypes) {
        std::cout << " " << toString(type);
    }
    std::cout << "\n\nCultures:\n ";
    for (const auto& culture : CultureTable::instance().names()) {
        std::cout << " " << culture;
    }
    std::cout << "\n\n";
}

void listUnits(const QuantityEngine& engine, const std::string& type_name,
               const std::string& culture) {
    std::cout << "\n";

    if (type_name.empty()) {
        std::cout << "Available Quantity Types:\n";
        std::cout << "=========================\n\n";

        for (const auto& quantity : engine.units().quantities()) {
            std::cout << std::setw(25) << std::left << quantity.name
                      << " (" << quantity.units.size() << " units, base "
                      << quantity.baseUnit().name << ")\n";
        }
        std::cout << "\nUse: quantity_converter --list <QuantityType> to see its units\n\n";
        return;
    }

    QuantityType type = parseQuantityType(type_name);

    std::cout << "Units of " << toString(type) << " (" << culture << ")\n";
    std::cout << std::string(70, '=') << "\n\n";
    std::cout << std::setw(28) << std::left << "Name"
              << std::setw(24) << "Abbreviations"
              << "To Base\n";
    std::cout << std::string(70, '-') << "\n";

    for (const auto& unit : engine.units().units(type)) {
        std::string abbreviations;
        try {
            for (const auto& abbreviation : engine.resolver().abbreviationsFor(type, unit, culture)) {
                if (!abbreviations.empty()) abbreviations += " ";
                abbreviations += abbreviation;
            }
        } catch (const AbbreviationNotFound&) {
            abbreviations = "(none)";
        }

        std::cout << std::setw(28) << std::left << unit.name
                  << std::setw(24) << abbreviations
                  << std::scientific << std::setprecision(6) << unit.factor << "\n";
    }
    std::cout << "\n";
}

const UnitInfo& resolveTargetUnit(const QuantityEngine& engine, QuantityType type,
                                  const std::string& name, const std::string& culture) {
    // Unit name ("Meter") first, then abbreviation ("m")
    const UnitInfo* unit = engine.units().findUnit(type, name);
    if (unit) {
        return *unit;
    }
    return engine.parseUnit(name, type, culture);
}

int performConversion(const QuantityEngine& engine, const std::string& text,
                      const std::string& type_name, const std::string& to_unit,
                      const std::string& culture) {
    QuantityType type = parseQuantityType(type_name);

    Quantity quantity;
    ParseFailure failure;
    if (!engine.tryParse(text, type, quantity, culture, &failure)) {
        std::cerr << "Error: " << failure.describe() << "\n";
        return 1;
    }

    const UnitInfo& base = engine.units().baseUnit(type);

    std::cout << "\n";
    std::cout << "Parse Result:\n";
    std::cout << "=============\n\n";
    std::cout << "  Input:   " << text << "\n";
    std::cout << "  Parsed:  " << quantity.value() << " " << quantity.unit().name << "\n";

    if (!to_unit.empty()) {
        const UnitInfo& target = resolveTargetUnit(engine, type, to_unit, culture);
        std::cout << "  Output:  " << engine.format(quantity.to(target), culture, 10) << "\n";
    }

    std::cout << "\n";
    std::cout << std::scientific << std::setprecision(9);
    std::cout << "  Base:    " << quantity.baseValue() << " " << base.name << "\n";

    if (type == QuantityType::LENGTH) {
        std::cout << "  Imperial: " << engine.formatFeetInches(quantity, culture) << "\n";
    }
    std::cout << "\n";
    return 0;
}

int main(int argc, char* argv[]) {
    if (argc == 1 || (argc == 2 && strcmp(argv[1], "--help") == 0)) {
        printHelp();
        return 0;
    }

    if (argc == 3 && strcmp(argv[1], "--template") == 0) {
        return ConfigReader::generateTemplate(argv[2]) ? 0 : 1;
    }

    // Split options from positional arguments
    std::vector<std::string> positional;
    std::string culture;
    std::string config_file;
    bool list = false;

    for (int i = 1; i < argc; ++i) {
        if (strcmp(argv[i], "--culture") == 0 && i + 1 < argc) {
            culture = argv[++i];
        } else if (strcmp(argv[i], "--config") == 0 && i + 1 < argc) {
            config_file = argv[++i];
        } else if (strcmp(argv[i], "--list") == 0) {
            list = true;
        } else if (argv[i][0] == '-' && argv[i][1] == '-') {
            std::cerr << "Error: Unknown option '" << argv[i] << "'\n";
            printHelp();
            return 1;
        } else {
            positional.push_back(argv[i]);
        }
    }

    try {
        EngineConfig config;
        if (!config_file.empty()) {
            ConfigReader reader;
            if (!reader.loadFile(config_file)) {
                return 1;
            }
            reader.parseEngineConfig(config);
        }

        QuantityEngine engine(config);
        if (culture.empty()) {
            culture = engine.defaultCulture();
        }

        if (list) {
            listUnits(engine, positional.empty() ? "" : positional[0], culture);
            return 0;
        }

        if (positional.size() < 2 || positional.size() > 3) {
            std::cerr << "Error: Invalid number of arguments\n";
            printHelp();
            return 1;
        }

        return performConversion(engine, positional[0], positional[1],
                                 positional.size() == 3 ? positional[2] : "", culture);

    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << "\n";
        return 1;
    }
}
