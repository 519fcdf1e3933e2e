// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// SDL back-end smoke tests. Run on SDL's dummy drivers, so no display or
// sound card is needed; only back-ends compiled into this build are tested.

#include <gtest/gtest.h>
#include "apal/platform.h"

#include <cstdlib>
#include <string>
#include <vector>

#if defined(APAL_HAS_SDL2) || defined(APAL_HAS_SDL3)

namespace {

std::vector<apal::Backend> compiledBackends() {
    std::vector<apal::Backend> out;
#if defined(APAL_HAS_SDL2)
    out.push_back(apal::Backend::SDL2);
#endif
#if defined(APAL_HAS_SDL3)
    out.push_back(apal::Backend::SDL3);
#endif
    return out;
}

class SdlBackendTest : public ::testing::TestWithParam<apal::Backend> {
protected:
    void SetUp() override {
        setenv("SDL_VIDEODRIVER", "dummy", 1);
        setenv("SDL_AUDIODRIVER", "dummy", 1);
    }
};

TEST_P(SdlBackendTest, BackendIsAvailable) {
    EXPECT_TRUE(apal::isBackendAvailable(GetParam()));
}

TEST_P(SdlBackendTest, HostClockAdvances) {
    auto clock = apal::createHostClock(GetParam());
    ASSERT_NE(clock, nullptr);
    ASSERT_EQ(clock->initialize(), apal::Result::Success);

    const uint64_t before = clock->getTicksUs();
    clock->sleepUs(5000);
    const uint64_t after = clock->getTicksUs();
    EXPECT_GE(after - before, 5000u);

    clock->shutdown();
    EXPECT_FALSE(clock->isInitialized());
}

TEST_P(SdlBackendTest, AudioAcceptsMatchingBuffers) {
    apal::DriverOptions options;
    options.audio_channels = 2;
    options.audio_format = apal::SampleFormat::S16;
    auto audio = apal::createAudioDriver(GetParam(), options);
    ASSERT_NE(audio, nullptr);
    if (audio->init(44100) != apal::Result::Success) {
        GTEST_SKIP() << "dummy audio driver unavailable";
    }

    std::vector<int16_t> samples(1470, 0);
    apal::AudioBuffer buffer;
    buffer.format = apal::SampleFormat::S16;
    buffer.channels = 2;
    buffer.s16 = samples;
    EXPECT_EQ(audio->playSamples(buffer), apal::Result::Success);

    buffer.channels = 1;
    EXPECT_EQ(audio->playSamples(buffer), apal::Result::InvalidParameter);

    audio->close();
    EXPECT_FALSE(audio->isRunning());
}

TEST_P(SdlBackendTest, VideoPresentsFrame) {
    apal::DriverOptions options;
    options.video_scale = 1;
    auto video = apal::createVideoDriver(GetParam(), options);
    ASSERT_NE(video, nullptr);
    if (video->init(128, 64) != apal::Result::Success) {
        GTEST_SKIP() << "dummy video driver unavailable";
    }

    std::vector<uint8_t> pixels(128 * 64 * 3, 0x80);
    apal::RgbFrame frame;
    frame.pixels = pixels;
    frame.width = 128;
    frame.height = 64;
    EXPECT_EQ(video->render(frame), apal::Result::Success);

    video->close();
    EXPECT_FALSE(video->isRunning());
}

INSTANTIATE_TEST_SUITE_P(Compiled, SdlBackendTest, ::testing::ValuesIn(compiledBackends()),
                         [](const auto& info) { return std::string(apal::toString(info.param)); });

} // namespace

#endif // APAL_HAS_SDL2 || APAL_HAS_SDL3
