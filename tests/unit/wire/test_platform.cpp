#include <gtest/gtest.h>

#include <chrono>
#include <string>
#include <thread>

#include "digistream/wire/utils/Platform.hpp"

using namespace DIGISTREAM::Wire;

TEST(PlatformTest, PlatformNameIsKnown)
{
    std::string name = Platform::getPlatformName();
#if defined(__linux__)
    EXPECT_EQ(name, "Linux");
#else
    EXPECT_FALSE(name.empty());
#endif
}

TEST(PlatformTest, SteadyTimestampMeasuresSleep)
{
    uint64_t start = getCurrentTimestampNs();
    std::this_thread::sleep_for(std::chrono::milliseconds(2));
    uint64_t elapsed = getCurrentTimestampNs() - start;
    EXPECT_GE(elapsed, 2000000u);
}
