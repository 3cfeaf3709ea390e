#include <gtest/gtest.h>
#include <spdlog/spdlog.h>

auto main(int argc, char **argv) -> int
{
    testing::InitGoogleTest(&argc, argv);
    spdlog::set_level(spdlog::level::off);
    return RUN_ALL_TESTS();
}
