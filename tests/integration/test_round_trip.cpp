/**
 * @file test_round_trip.cpp
 * @brief Integration tests: format then parse every unit in every culture
 */

#include <gtest/gtest.h>
#include "QuantityEngine.hpp"
#include <string>
#include <vector>

using namespace Quantica;

class RoundTripTest : public ::testing::Test {
protected:
    bool hasAbbreviation(QuantityType type, const UnitInfo& unit, const std::string& culture) {
        try {
            engine.resolver().abbreviationsFor(type, unit, culture);
            return true;
        } catch (const AbbreviationNotFound&) {
            return false;
        }
    }

    QuantityEngine engine;
};

TEST_F(RoundTripTest, EveryUnitInEveryCulture) {
    const double values[] = {3.25, -7.5, 1234.5};
    size_t checked = 0;

    for (const auto& culture : engine.cultures().names()) {
        for (QuantityType type : kAllQuantityTypes) {
            for (const auto& unit : engine.units().units(type)) {
                if (!hasAbbreviation(type, unit, culture)) {
                    continue;
                }

                for (double value : values) {
                    const Quantity original(value, unit);
                    const std::string text = engine.format(original, culture);

                    Quantity parsed;
                    ParseFailure failure;
                    ASSERT_TRUE(engine.tryParse(text, type, parsed, culture, &failure))
                        << failure.describe();
                    EXPECT_EQ(&parsed.unit(), &unit)
                        << text << " (" << culture << ") parsed as " << parsed.unit().name;
                    EXPECT_DOUBLE_EQ(parsed.value(), value) << text << " (" << culture << ")";
                    ++checked;
                }
            }
        }
    }

    EXPECT_GT(checked, 500u);
}

TEST_F(RoundTripTest, OnlyTwipLacksAbbreviations) {
    for (const auto& culture : engine.cultures().names()) {
        for (QuantityType type : kAllQuantityTypes) {
            for (const auto& unit : engine.units().units(type)) {
                if (unit.name == "Twip") {
                    EXPECT_FALSE(hasAbbreviation(type, unit, culture));
                } else {
                    EXPECT_TRUE(hasAbbreviation(type, unit, culture))
                        << unit.name << " in " << culture;
                }
            }
        }
    }
}

TEST_F(RoundTripTest, FeetInchesInEveryCulture) {
    for (double inches : {28.0, -20.0, -30.0}) {
        const Quantity length = Quantity::from(inches, QuantityType::LENGTH, "Inch");

        for (const auto& culture : engine.cultures().names()) {
            const std::string text = engine.formatFeetInches(length, culture);

            Quantity parsed;
            ParseFailure failure;
            ASSERT_TRUE(engine.tryParseComposite(text, QuantityType::LENGTH, parsed, culture,
                                                 &failure))
                << failure.describe();
            EXPECT_NEAR(parsed.as("Inch"), inches, 1e-9) << text << " (" << culture << ")";
        }
    }
}

TEST_F(RoundTripTest, ConvertedValuesSurvive) {
    Quantity miles = engine.parse("26.2 mi", QuantityType::LENGTH);
    Quantity km = miles.to("Kilometer");

    Quantity parsed = engine.parse(engine.format(km, "de-DE"), QuantityType::LENGTH, "de-DE");
    EXPECT_EQ(parsed.unit().name, "Kilometer");
    EXPECT_TRUE(parsed.equals(miles, 1e-9));
}
