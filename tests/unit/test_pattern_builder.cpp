/**
 * @file test_pattern_builder.cpp
 * @brief Unit tests for PatternBuilder and PatternCache
 */

#include <gtest/gtest.h>
#include "PatternBuilder.hpp"
#include "PatternCache.hpp"
#include "QuantityErrors.hpp"
#include <boost/regex.hpp>
#include <memory>

using namespace Quantica;

class PatternBuilderTest : public ::testing::Test {
protected:
    PatternBuilderTest()
        : resolver(UnitTable::instance()),
          builder(resolver, CultureTable::instance()) {}

    boost::regex unitRegex(QuantityType type, const std::string& unit_name,
                           const std::string& culture, bool anchored = true) {
        const UnitInfo& unit = UnitTable::instance().getUnit(type, unit_name);
        return boost::regex(builder.buildUnitPattern(type, unit, culture, anchored),
                            boost::regex::perl);
    }

    AbbreviationResolver resolver;
    PatternBuilder builder;
};

// =============================================================================
// Building blocks
// =============================================================================

TEST_F(PatternBuilderTest, EscapeMetacharacters) {
    EXPECT_EQ(PatternBuilder::escape("m/s"), "m\\/s");
    EXPECT_EQ(PatternBuilder::escape("t (short)"), "t\\s\\(short\\)");
    EXPECT_EQ(PatternBuilder::escape("уз."), "уз\\.");
    EXPECT_EQ(PatternBuilder::escape("kg"), "kg");
}

TEST_F(PatternBuilderTest, AlternationKeepsOrder) {
    EXPECT_EQ(PatternBuilder::alternation({"hrs", "hr", "h"}), "hrs|hr|h");
    EXPECT_EQ(PatternBuilder::alternation({"ft", "'"}), "ft|'");
}

TEST_F(PatternBuilderTest, NumberPatternEnglish) {
    const NumberFormat& en = CultureTable::instance().get("en-US");
    boost::regex number(PatternBuilder::numberPattern(en), boost::regex::perl);

    EXPECT_TRUE(boost::regex_match(std::string("2.5"), number));
    EXPECT_TRUE(boost::regex_match(std::string("-2"), number));
    EXPECT_TRUE(boost::regex_match(std::string("+.5"), number));
    EXPECT_TRUE(boost::regex_match(std::string("1,234,567.5"), number));
    EXPECT_TRUE(boost::regex_match(std::string("6.02e23"), number));
    EXPECT_FALSE(boost::regex_match(std::string("2,5"), number));
    EXPECT_FALSE(boost::regex_match(std::string("abc"), number));
    EXPECT_FALSE(boost::regex_match(std::string("."), number));
}

TEST_F(PatternBuilderTest, NumberPatternNorwegian) {
    const NumberFormat& nb = CultureTable::instance().get("nb-NO");
    boost::regex number(PatternBuilder::numberPattern(nb), boost::regex::perl);

    EXPECT_TRUE(boost::regex_match(std::string("2,5"), number));
    EXPECT_TRUE(boost::regex_match(std::string("\xE2\x88\x92" "2,5"), number));
    EXPECT_TRUE(boost::regex_match(std::string("1\xC2\xA0" "000"), number));
    EXPECT_FALSE(boost::regex_match(std::string("2.5"), number));
}

// =============================================================================
// Unit patterns
// =============================================================================

TEST_F(PatternBuilderTest, AnchoredPatternCapturesValueAndUnit) {
    boost::regex kg = unitRegex(QuantityType::MASS, "Kilogram", "en-US");

    const std::string spaced = "2.5 kg";
    const std::string tight = "2.5kg";

    boost::smatch match;
    ASSERT_TRUE(boost::regex_match(spaced, match, kg));
    EXPECT_EQ(match["value"].str(), "2.5");
    EXPECT_EQ(match["unit"].str(), "kg");

    ASSERT_TRUE(boost::regex_match(tight, match, kg));
    EXPECT_EQ(match["value"].str(), "2.5");
}

TEST_F(PatternBuilderTest, AtMostOneSpaceBetweenNumberAndUnit) {
    boost::regex kg = unitRegex(QuantityType::MASS, "Kilogram", "en-US");
    EXPECT_TRUE(boost::regex_match(std::string("2.5 kg"), kg));
    EXPECT_FALSE(boost::regex_match(std::string("2.5  kg"), kg));
}

TEST_F(PatternBuilderTest, AnchoredPatternRejectsTrailingText) {
    boost::regex foot = unitRegex(QuantityType::LENGTH, "Foot", "en-US");
    EXPECT_TRUE(boost::regex_match(std::string("2 ft"), foot));
    EXPECT_TRUE(boost::regex_match(std::string("2'"), foot));
    EXPECT_FALSE(boost::regex_match(std::string("2 ft 4 in"), foot));
    EXPECT_FALSE(boost::regex_match(std::string("2 fts"), foot));
}

TEST_F(PatternBuilderTest, LongestAbbreviationWins) {
    boost::regex hour = unitRegex(QuantityType::DURATION, "Hour", "en-US");

    const std::string hours = "3 hours";
    const std::string hrs = "3 hrs";

    boost::smatch match;
    ASSERT_TRUE(boost::regex_match(hours, match, hour));
    EXPECT_EQ(match["unit"].str(), "hours");
    ASSERT_TRUE(boost::regex_match(hrs, match, hour));
    EXPECT_EQ(match["unit"].str(), "hrs");
}

TEST_F(PatternBuilderTest, FragmentHasNoCapturingGroups) {
    boost::regex fragment = unitRegex(QuantityType::LENGTH, "Foot", "en-US", false);

    boost::smatch match;
    std::string text = "total 2 ft here";
    ASSERT_TRUE(boost::regex_search(text, match, fragment));
    EXPECT_EQ(match.size(), 1u);
    EXPECT_EQ(match[0].str(), "2 ft");
}

TEST_F(PatternBuilderTest, LocalizedPattern) {
    boost::regex kg = unitRegex(QuantityType::MASS, "Kilogram", "ru-RU");
    EXPECT_TRUE(boost::regex_match(std::string("2,5 кг"), kg));
    EXPECT_FALSE(boost::regex_match(std::string("2,5 kg"), kg));
}

TEST_F(PatternBuilderTest, UnitWithoutAbbreviationsThrows) {
    const UnitInfo& twip = UnitTable::instance().getUnit(QuantityType::LENGTH, "Twip");
    EXPECT_THROW(builder.buildUnitPattern(QuantityType::LENGTH, twip, "en-US", true),
                 NoAbbreviationsForUnit);
}

TEST_F(PatternBuilderTest, UnknownCultureThrows) {
    const UnitInfo& foot = UnitTable::instance().getUnit(QuantityType::LENGTH, "Foot");
    EXPECT_THROW(builder.buildUnitPattern(QuantityType::LENGTH, foot, "fr-FR", true),
                 UnknownCulture);
}

// =============================================================================
// Pattern cache
// =============================================================================

TEST(PatternCacheTest, KeysDistinguishAnchoring) {
    EXPECT_NE(PatternCache::makeKey(QuantityType::LENGTH, "Foot", "en-US", true),
              PatternCache::makeKey(QuantityType::LENGTH, "Foot", "en-US", false));
    EXPECT_NE(PatternCache::makeKey(QuantityType::LENGTH, "Foot", "en-US", true),
              PatternCache::makeKey(QuantityType::LENGTH, "Foot", "nb-NO", true));
}

TEST(PatternCacheTest, FactoryRunsOncePerKey) {
    PatternCache cache;
    int calls = 0;
    auto factory = [&calls]() {
        ++calls;
        auto pattern = std::make_shared<ParsePattern>();
        pattern->source = "x";
        pattern->regex.assign("x", boost::regex::perl);
        return std::shared_ptr<const ParsePattern>(pattern);
    };

    auto first = cache.getOrCreate("k", factory);
    auto second = cache.getOrCreate("k", factory);
    EXPECT_EQ(calls, 1);
    EXPECT_EQ(first.get(), second.get());
    EXPECT_EQ(cache.size(), 1u);
    EXPECT_EQ(cache.find("k").get(), first.get());
    EXPECT_EQ(cache.find("missing"), nullptr);

    cache.clear();
    EXPECT_EQ(cache.size(), 0u);
}

TEST(PatternCacheTest, FailedFactoryCachesNothing) {
    PatternCache cache;
    auto failing = []() -> std::shared_ptr<const ParsePattern> {
        throw NoAbbreviationsForUnit(QuantityType::LENGTH, "Twip", "en-US");
    };

    EXPECT_THROW(cache.getOrCreate("twip", failing), NoAbbreviationsForUnit);
    EXPECT_EQ(cache.size(), 0u);
}
