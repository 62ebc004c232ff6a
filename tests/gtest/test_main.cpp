#include <gtest/gtest.h>
#include "threnody/logging.hpp"

int main(int argc, char **argv) {
    ::testing::InitGoogleTest(&argc, argv);

    // Suppress logs during tests unless explicitly needed
    threnody::Logger::getInstance()->set_level(threnody::LogLevel::ERROR);

    return RUN_ALL_TESTS();
}
