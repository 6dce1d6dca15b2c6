/**
 * @file test_quantity_engine.cpp
 * @brief Unit tests for QuantityEngine set-up, parsing and formatting
 */

#include <gtest/gtest.h>
#include "QuantityEngine.hpp"
#include <cmath>
#include <stdexcept>

using namespace Quantica;

class QuantityEngineTest : public ::testing::Test {
protected:
    QuantityEngine engine;
};

// =============================================================================
// Defaults
// =============================================================================

TEST_F(QuantityEngineTest, DefaultConfiguration) {
    EXPECT_EQ(engine.defaultCulture(), "en-US");
    EXPECT_EQ(engine.resolver().fallbackCulture(), "en-US");
    EXPECT_EQ(engine.operators().divisionPolicy(), DivisionPolicy::THROW);
    EXPECT_FALSE(engine.parser().verbose());
    EXPECT_TRUE(engine.parser().composites().has(QuantityType::LENGTH));
}

TEST_F(QuantityEngineTest, EmptyCultureMeansDefault) {
    Quantity q = engine.parse("2.5 kg", QuantityType::MASS);
    EXPECT_EQ(q.unit().name, "Kilogram");
    EXPECT_EQ(&engine.parseUnit("kg", QuantityType::MASS),
              &engine.units().getUnit(QuantityType::MASS, "Kilogram"));
}

TEST_F(QuantityEngineTest, ExplicitCulture) {
    Quantity q;
    ASSERT_TRUE(engine.tryParse("2,5 кг", QuantityType::MASS, q, "ru-RU"));
    EXPECT_DOUBLE_EQ(q.value(), 2.5);
    EXPECT_FALSE(engine.tryParse("2,5 кг", QuantityType::MASS, q));
}

TEST_F(QuantityEngineTest, CompositeThroughEngine) {
    Quantity q = engine.parseComposite("2' 4\"", QuantityType::LENGTH);
    EXPECT_NEAR(q.as("Inch"), 28.0, 1e-9);
}

TEST_F(QuantityEngineTest, Arithmetic) {
    Quantity width = engine.parse("3 m", QuantityType::LENGTH);
    Quantity depth = engine.parse("200 cm", QuantityType::LENGTH);
    Quantity area = engine.multiply(width, depth);
    EXPECT_EQ(area.type(), QuantityType::AREA);
    EXPECT_NEAR(area.value(), 6.0, 1e-12);

    Quantity back = engine.divide(area, width);
    EXPECT_NEAR(back.as("Centimeter"), 200.0, 1e-9);
}

TEST_F(QuantityEngineTest, AbbreviationsFor) {
    auto abbreviations = engine.abbreviationsFor(QuantityType::LENGTH, "Inch", "nb-NO");
    ASSERT_FALSE(abbreviations.empty());
    EXPECT_EQ(abbreviations.front(), "tommer");
    EXPECT_THROW(engine.abbreviationsFor(QuantityType::LENGTH, "Parsec"), UnknownUnit);
    EXPECT_THROW(engine.abbreviationsFor(QuantityType::LENGTH, "Twip"), AbbreviationNotFound);
}

// =============================================================================
// Formatting
// =============================================================================

TEST_F(QuantityEngineTest, Format) {
    Quantity kg = Quantity::from(2.5, QuantityType::MASS, "Kilogram");
    EXPECT_EQ(engine.format(kg), "2.5 kg");
    EXPECT_EQ(engine.format(kg, "ru-RU"), "2,5 кг");
    EXPECT_EQ(engine.format(kg, "de-DE"), "2,5 kg");

    Quantity foot = Quantity::from(-1.5, QuantityType::LENGTH, "Foot");
    EXPECT_EQ(engine.format(foot, "nb-NO"), "\xE2\x88\x92" "1,5 fot");
}

TEST_F(QuantityEngineTest, FormatPrecision) {
    Quantity third = Quantity::from(1.0 / 3.0, QuantityType::DURATION, "Hour");
    EXPECT_EQ(engine.format(third, "en-US", 3), "0.333 h");
}

TEST_F(QuantityEngineTest, FormatParsesBack) {
    Quantity original = Quantity::from(1234.5, QuantityType::SPEED, "KilometerPerHour");
    for (const auto& culture : engine.cultures().names()) {
        Quantity parsed = engine.parse(engine.format(original, culture), QuantityType::SPEED,
                                       culture);
        EXPECT_EQ(&parsed.unit(), &original.unit()) << culture;
        EXPECT_DOUBLE_EQ(parsed.value(), original.value()) << culture;
    }
}

TEST_F(QuantityEngineTest, FormatUnitWithoutAbbreviationThrows) {
    Quantity twips = Quantity::from(10.0, QuantityType::LENGTH, "Twip");
    EXPECT_THROW(engine.format(twips), AbbreviationNotFound);
}

TEST_F(QuantityEngineTest, FormatFeetInches) {
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(66.0, QuantityType::LENGTH, "Inch")),
              "5 ft 6 in");
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(1.8288, QuantityType::LENGTH, "Meter")),
              "6 ft 0 in");
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(-2.5, QuantityType::LENGTH, "Foot")),
              "-3 ft 6 in");
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(-20.0, QuantityType::LENGTH, "Inch")),
              "-2 ft 4 in");
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(-0.1, QuantityType::LENGTH, "Inch")),
              "0 ft 0 in");
    EXPECT_EQ(engine.formatFeetInches(Quantity::from(28.0, QuantityType::LENGTH, "Inch"), "nb-NO"),
              "2 fot 4 tommer");
}

TEST_F(QuantityEngineTest, FormatFeetInchesCarriesRoundedInches) {
    Quantity almost_six = Quantity::from(71.8, QuantityType::LENGTH, "Inch");
    EXPECT_EQ(engine.formatFeetInches(almost_six), "6 ft 0 in");
}

TEST_F(QuantityEngineTest, FormatFeetInchesNegativeParsesBack) {
    for (double inches : {-20.0, -12.0, -30.0, -1.0, -66.0}) {
        Quantity length = Quantity::from(inches, QuantityType::LENGTH, "Inch");
        Quantity back = engine.parse(engine.formatFeetInches(length), QuantityType::LENGTH);
        EXPECT_NEAR(back.as("Inch"), inches, 1e-9) << engine.formatFeetInches(length);
    }
}

TEST_F(QuantityEngineTest, FormatFeetInchesRequiresLength) {
    EXPECT_THROW(engine.formatFeetInches(Quantity::from(1.0, QuantityType::MASS, "Pound")),
                 DimensionMismatch);
}

// =============================================================================
// Configuration
// =============================================================================

TEST(QuantityEngineConfigTest, DefaultCulture) {
    EngineConfig config;
    config.default_culture = "ru-RU";
    QuantityEngine engine(config);

    Quantity q = engine.parse("2,5 кг", QuantityType::MASS);
    EXPECT_DOUBLE_EQ(q.value(), 2.5);
    EXPECT_EQ(engine.format(q), "2,5 кг");
}

TEST(QuantityEngineConfigTest, FallbackCulture) {
    EngineConfig config;
    config.fallback_culture = "ru-RU";
    QuantityEngine engine(config);

    // Pound has no de-DE abbreviation, so the Russian one applies
    Quantity q = engine.parse("3 фунт", QuantityType::MASS, "de-DE");
    EXPECT_EQ(q.unit().name, "Pound");
}

TEST(QuantityEngineConfigTest, CustomAbbreviations) {
    EngineConfig config;
    config.abbreviations.push_back({QuantityType::LENGTH, "Foot", "en-US", "feet"});
    config.abbreviations.push_back({QuantityType::LENGTH, "Twip", "en-US", "twip"});
    QuantityEngine engine(config);

    EXPECT_EQ(engine.parse("3 feet", QuantityType::LENGTH).unit().name, "Foot");
    EXPECT_EQ(engine.parse("1440 twip", QuantityType::LENGTH).unit().name, "Twip");
    EXPECT_EQ(engine.format(Quantity::from(3.0, QuantityType::LENGTH, "Foot")), "3 ft");
}

TEST(QuantityEngineConfigTest, CustomAbbreviationDoesNotLeakBetweenEngines) {
    EngineConfig config;
    config.abbreviations.push_back({QuantityType::LENGTH, "Foot", "en-US", "feet"});
    QuantityEngine custom(config);
    QuantityEngine plain;

    Quantity q;
    EXPECT_TRUE(custom.tryParse("3 feet", QuantityType::LENGTH, q));
    EXPECT_FALSE(plain.tryParse("3 feet", QuantityType::LENGTH, q));
}

TEST(QuantityEngineConfigTest, Composites) {
    EngineConfig config;
    config.composites.push_back({QuantityType::MASS, stonePoundsGrammar()});
    QuantityEngine engine(config);

    Quantity q = engine.parse("11 st 6 lb", QuantityType::MASS);
    EXPECT_NEAR(q.as("Pound"), 160.0, 1e-9);
}

TEST(QuantityEngineConfigTest, WithoutBuiltinComposites) {
    EngineConfig config;
    config.builtin_composites = false;
    QuantityEngine engine(config);

    Quantity q;
    EXPECT_FALSE(engine.tryParse("2 ft 4 in", QuantityType::LENGTH, q));
    EXPECT_TRUE(engine.tryParse("2 ft", QuantityType::LENGTH, q));
}

TEST(QuantityEngineConfigTest, DivisionPolicy) {
    EngineConfig config;
    config.division_policy = DivisionPolicy::IEEE754;
    QuantityEngine engine(config);

    Quantity speed = engine.divide(engine.parse("1 m", QuantityType::LENGTH),
                                   engine.parse("0 s", QuantityType::DURATION));
    EXPECT_TRUE(std::isinf(speed.value()));
}

TEST(QuantityEngineConfigTest, InvalidConfigurationThrows) {
    EngineConfig bad_culture;
    bad_culture.default_culture = "fr-FR";
    EXPECT_THROW(QuantityEngine engine(bad_culture), UnknownCulture);

    EngineConfig bad_fallback;
    bad_fallback.fallback_culture = "xx";
    EXPECT_THROW(QuantityEngine engine(bad_fallback), UnknownCulture);

    EngineConfig bad_unit;
    bad_unit.abbreviations.push_back({QuantityType::LENGTH, "Parsec", "en-US", "pc"});
    EXPECT_THROW(QuantityEngine engine(bad_unit), UnknownUnit);

    EngineConfig bad_mapping_culture;
    bad_mapping_culture.abbreviations.push_back({QuantityType::LENGTH, "Foot", "fr-FR", "pi"});
    EXPECT_THROW(QuantityEngine engine(bad_mapping_culture), UnknownCulture);

    EngineConfig bad_separator;
    bad_separator.composites.push_back(
        {QuantityType::LENGTH, {"Broken", {{"Yard", "[" }, {"Foot", ""}}}});
    EXPECT_THROW(QuantityEngine engine(bad_separator), std::invalid_argument);
}
