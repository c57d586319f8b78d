/**
 * @file test_main.cpp
 * @brief GoogleTest entry point for the elac Compiler unit tests
 */

#include "Core/ElacConfig.h"
#include "Core/Logger.h"

#include <gtest/gtest.h>
#include <iostream>

namespace {

// Prints the build configuration once and the wall time of the whole run
class CompilerTestEnvironment : public ::testing::Environment {
public:
    void SetUp() override {
        std::cout << "---- elac Compiler unit tests ----\n";
        elac::config::print_config();
        timer_.start();
    }

    void TearDown() override {
        timer_.stop();
        std::cout << "---- elac Compiler: " << static_cast<long>(timer_.elapsed() * 1000.0) << " ms ----\n";
    }

private:
    elac::Timer timer_{};
};

} // namespace

int main(int argc, char** argv) {
    ::testing::InitGoogleTest(&argc, argv);
    ::testing::AddGlobalTestEnvironment(new CompilerTestEnvironment);
    return RUN_ALL_TESTS();
}
