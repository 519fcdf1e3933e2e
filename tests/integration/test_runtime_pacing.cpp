/**
 * @file test_runtime_pacing.cpp
 * @brief Wall-clock pacing of a headless session.
 *
 * Runs on the steady host clock the runtime picks for the Null back-end,
 * so these tests take real time (about two seconds).
 */

#include <gtest/gtest.h>
#include "arduplay/runtime.h"
#include "fake_core.h"

#include <chrono>

using namespace arduplay;

class RuntimePacingTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_ = dir_.write("arcodia.hex", ":00000001FF\n");
        set_log_level(LogLevel::Warn);
    }

    void TearDown() override {
        set_log_level(LogLevel::Info);
    }

    test::TempDir dir_;
    std::filesystem::path content_;
};

TEST_F(RuntimePacingTest, HoldsTargetRate) {
    auto config = RuntimeConfigBuilder()
        .target_fps(60.0)
        .max_frames(120)
        .headless()
        .snapshot_dir(dir_.path())
        .build();
    ASSERT_TRUE(config.has_value());

    Runtime runtime(*config, std::make_unique<SessionBridge>(test::make_fake_factory()));
    ASSERT_TRUE(runtime.start("fake_libretro.so", content_).has_value());

    const auto begin = std::chrono::steady_clock::now();
    auto result = runtime.run();
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    ASSERT_TRUE(result.has_value()) << result.error().format();
    EXPECT_EQ(runtime.frame_count(), 120u);
    EXPECT_GE(seconds, 1.8);
    EXPECT_LE(seconds, 2.2);
    EXPECT_NEAR(runtime.stats().average_fps, 60.0, 3.0);
}

TEST_F(RuntimePacingTest, SlowerTargetTakesLonger) {
    auto config = RuntimeConfigBuilder()
        .target_fps(20.0)
        .max_frames(10)
        .headless()
        .snapshot_dir(dir_.path())
        .build();
    ASSERT_TRUE(config.has_value());

    Runtime runtime(*config, std::make_unique<SessionBridge>(test::make_fake_factory()));
    ASSERT_TRUE(runtime.start("fake_libretro.so", content_).has_value());

    const auto begin = std::chrono::steady_clock::now();
    ASSERT_TRUE(runtime.run().has_value());
    const double seconds = std::chrono::duration<double>(std::chrono::steady_clock::now() - begin).count();

    // Ten frames at 50 ms each
    EXPECT_GE(seconds, 0.45);
    EXPECT_LE(seconds, 0.7);
}
