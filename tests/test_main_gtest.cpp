/**
 * @file test_main_gtest.cpp
 * @brief Main entry point for GTest test suite
 */

#include <gtest/gtest.h>

int main(int argc, char **argv) {
    // Initialize GTest
    ::testing::InitGoogleTest(&argc, argv);

    // Run all tests
    return RUN_ALL_TESTS();
}
