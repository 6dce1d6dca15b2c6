/**
 * @file test_concurrent_parsing.cpp
 * @brief Integration tests: one engine shared by several threads
 */

#include <gtest/gtest.h>
#include "QuantityEngine.hpp"
#include <atomic>
#include <string>
#include <thread>
#include <vector>

using namespace Quantica;

namespace {

struct Case {
    std::string text;
    QuantityType type;
    std::string culture;
};

const std::vector<Case>& cases() {
    static const std::vector<Case> kCases = {
        {"2.5 kg", QuantityType::MASS, "en-US"},
        {"2,5 кг", QuantityType::MASS, "ru-RU"},
        {"1 ton", QuantityType::MASS, "en-US"},
        {"5 m", QuantityType::DURATION, "en-US"},
        {"5 mm", QuantityType::LENGTH, "en-US"},
        {"2 ft 4 in", QuantityType::LENGTH, "en-US"},
        {"2' 4\"", QuantityType::LENGTH, "en-US"},
        {"2 fot 4 tommer", QuantityType::LENGTH, "nb-NO"},
        {"1.234,5 m", QuantityType::LENGTH, "de-DE"},
        {"60 mph", QuantityType::SPEED, "en-US"},
        {"3 sq ft", QuantityType::AREA, "en-US"},
        {"9,81 m/s²", QuantityType::ACCELERATION, "nb-NO"},
        {"12 N·m", QuantityType::TORQUE, "en-US"},
        {"1 St", QuantityType::KINEMATIC_VISCOSITY, "en-US"},
        {"2 gal (U.S.)", QuantityType::VOLUME, "en-US"},
        {"4 kN", QuantityType::FORCE, "en-US"},
    };
    return kCases;
}

} // namespace

class ConcurrentParsingTest : public ::testing::Test {
protected:
    void SetUp() override {
        // Reference results from a separate, single-threaded engine
        QuantityEngine reference;
        for (const auto& c : cases()) {
            expected.push_back(reference.parse(c.text, c.type, c.culture));
        }
    }

    QuantityEngine engine;
    std::vector<Quantity> expected;
};

TEST_F(ConcurrentParsingTest, SharedEngineGivesSameResults) {
    const int num_threads = 8;
    const int iterations = 200;

    std::atomic<int> mismatches{0};
    std::atomic<int> failures{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&, t]() {
            for (int i = 0; i < iterations; ++i) {
                // Threads walk the cases from different offsets so that
                // patterns are first compiled concurrently
                const size_t index = static_cast<size_t>(t + i) % cases().size();
                const Case& c = cases()[index];

                Quantity q;
                if (!engine.tryParse(c.text, c.type, q, c.culture)) {
                    ++failures;
                    continue;
                }
                if (&q.unit() != &expected[index].unit() ||
                    q.value() != expected[index].value()) {
                    ++mismatches;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(failures.load(), 0);
    EXPECT_EQ(mismatches.load(), 0);
}

TEST_F(ConcurrentParsingTest, ConcurrentFormattingAndArithmetic) {
    const int num_threads = 4;
    std::atomic<int> errors{0};
    std::vector<std::thread> threads;

    for (int t = 0; t < num_threads; ++t) {
        threads.emplace_back([&]() {
            for (int i = 0; i < 100; ++i) {
                Quantity length = engine.parse("3 m", QuantityType::LENGTH);
                Quantity area = engine.multiply(length, length);
                if (engine.format(area) != "9 m²") {
                    ++errors;
                }
                if (engine.formatFeetInches(engine.parse("66 in", QuantityType::LENGTH)) !=
                    "5 ft 6 in") {
                    ++errors;
                }
            }
        });
    }

    for (auto& thread : threads) {
        thread.join();
    }

    EXPECT_EQ(errors.load(), 0);
}

TEST_F(ConcurrentParsingTest, CacheIsSharedAcrossThreads) {
    std::vector<std::thread> threads;
    for (int t = 0; t < 4; ++t) {
        threads.emplace_back([this]() {
            Quantity q;
            engine.tryParse("2.5 kg", QuantityType::MASS, q);
        });
    }
    for (auto& thread : threads) {
        thread.join();
    }

    const size_t cached = engine.parser().cachedPatterns();
    Quantity q;
    engine.tryParse("2.5 kg", QuantityType::MASS, q);
    EXPECT_EQ(engine.parser().cachedPatterns(), cached);
}
