/**
 * @file test_main.cpp
 * @brief Test entry point - quiet logging and a private config for the suite
 */

#include <gtest/gtest.h>
#include <gmock/gmock.h>

#include "config.hpp"
#include "log.hpp"

#include <iostream>

namespace ModlayerTest {

// =============================================================================
// Global Test Environment
// =============================================================================

class ModlayerTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "=== modlayer Test Suite Starting ===" << std::endl;

        // Keep stdout readable; failures still surface through assertions
        Log::SetQuiet(true);
        Log::SetLevel(Log::LEVEL_DEBUG);

        // Tests never read the user's config file
        Config::GetInstance()->Reset();
        Config::GetInstance()->io_retry_delay_ms = 0;
    }

    void TearDown() override {
        std::cout << "=== modlayer Test Suite Complete ===" << std::endl;
        Log::FreeLogFile();
    }
};

} // namespace ModlayerTest

// =============================================================================
// Main Entry Point
// =============================================================================

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::InitGoogleMock(&argc, argv);

    ::testing::AddGlobalTestEnvironment(new ModlayerTest::ModlayerTestEnvironment());

    return RUN_ALL_TESTS();
}
