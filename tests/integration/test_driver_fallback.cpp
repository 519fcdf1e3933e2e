/**
 * @file test_driver_fallback.cpp
 * @brief Sessions keep running when drivers are missing or misbehave.
 */

#include <gtest/gtest.h>
#include "arduplay/runtime.h"
#include "apal/platform.h"
#include "fake_core.h"
#include "test_drivers.h"

using namespace arduplay;

class DriverFallbackTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_ = dir_.write("arcodia.hex", ":00000001FF\n");
        set_log_level(LogLevel::Error);
    }

    void TearDown() override {
        set_log_level(LogLevel::Info);
    }

    RuntimeConfig config_for(apal::Backend backend, uint64_t frames) {
        auto config = RuntimeConfigBuilder()
            .backend(backend)
            .max_frames(frames)
            .snapshot_dir(dir_.path())
            .build();
        EXPECT_TRUE(config.has_value());
        return config.value_or(RuntimeConfig{});
    }

    test::TempDir dir_;
    std::filesystem::path content_;
};

// A back-end that is not compiled in is replaced by null drivers
TEST_F(DriverFallbackTest, MissingBackendRunsHeadless) {
    for (auto backend : {apal::Backend::SDL2, apal::Backend::SDL3}) {
        if (apal::isBackendAvailable(backend)) {
            continue;
        }
        Runtime runtime(config_for(backend, 30),
                        std::make_unique<SessionBridge>(test::make_fake_factory()),
                        std::make_unique<apal::VirtualHostClock>());
        ASSERT_TRUE(runtime.start("fake_libretro.so", content_).has_value());
        EXPECT_STREQ(runtime.video_driver()->name(), "null");
        EXPECT_STREQ(runtime.audio_driver()->name(), "null");
        EXPECT_STREQ(runtime.input_driver()->name(), "null");

        ASSERT_TRUE(runtime.run().has_value());
        EXPECT_EQ(runtime.frame_count(), 30u);
    }
}

// Every driver failing at once still lets the core run to completion
TEST_F(DriverFallbackTest, AllDriversFailingEveryFrame) {
    Runtime runtime(config_for(apal::Backend::Null, 60),
                    std::make_unique<SessionBridge>(test::make_fake_factory()),
                    std::make_unique<apal::VirtualHostClock>());

    auto video = std::make_unique<test::FaultyVideoDriver>();
    video->throw_on_render = true;
    auto audio = std::make_unique<test::FaultyAudioDriver>();
    audio->play_result = apal::Result::BufferFull;
    auto input = std::make_unique<test::FaultyInputDriver>();
    input->throw_on_poll = true;
    ASSERT_TRUE(runtime.set_video_driver(std::move(video)).has_value());
    ASSERT_TRUE(runtime.set_audio_driver(std::move(audio)).has_value());
    ASSERT_TRUE(runtime.set_input_driver(std::move(input)).has_value());

    ASSERT_TRUE(runtime.start("fake_libretro.so", content_).has_value());
    auto result = runtime.run();
    ASSERT_TRUE(result.has_value()) << result.error().format();

    EXPECT_EQ(runtime.frame_count(), 60u);
    EXPECT_EQ(runtime.stats().video_drops, 60u);
    EXPECT_EQ(runtime.stats().audio_drops, 60u);
    EXPECT_EQ(runtime.stats().input_failures, 60u);
    EXPECT_EQ(runtime.driver_errors().distinct(), 3u);
}

// Drivers that refuse to start are swapped for null ones
TEST_F(DriverFallbackTest, RefusingDriversReplaced) {
    Runtime runtime(config_for(apal::Backend::Null, 10),
                    std::make_unique<SessionBridge>(test::make_fake_factory()),
                    std::make_unique<apal::VirtualHostClock>());

    auto video = std::make_unique<test::FaultyVideoDriver>();
    video->throw_on_init = true;
    auto audio = std::make_unique<test::FaultyAudioDriver>();
    audio->init_result = apal::Result::DeviceNotFound;
    ASSERT_TRUE(runtime.set_video_driver(std::move(video)).has_value());
    ASSERT_TRUE(runtime.set_audio_driver(std::move(audio)).has_value());

    ASSERT_TRUE(runtime.start("fake_libretro.so", content_).has_value());
    EXPECT_STREQ(runtime.video_driver()->name(), "null");
    EXPECT_STREQ(runtime.audio_driver()->name(), "null");

    ASSERT_TRUE(runtime.run().has_value());
    EXPECT_EQ(runtime.frame_count(), 10u);
    EXPECT_EQ(runtime.stats().video_drops, 0u);
}
