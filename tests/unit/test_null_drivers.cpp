// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors

#include <gtest/gtest.h>
#include "apal/null_drivers.h"
#include "apal/platform.h"

#include <vector>

namespace apal {
namespace {

// ═══════════════════════════════════════════════════════════════════════════
// NullVideoDriver
// ═══════════════════════════════════════════════════════════════════════════

class NullVideoDriverTest : public ::testing::Test {
protected:
    void SetUp() override {
        pixels_.assign(128 * 64 * 3, 0x7F);
    }

    RgbFrame frame() const { return RgbFrame{pixels_, 128, 64}; }

    NullVideoDriver driver_;
    std::vector<uint8_t> pixels_;
};

TEST_F(NullVideoDriverTest, InitSucceeds) {
    EXPECT_EQ(driver_.init(128, 64), Result::Success);
    EXPECT_TRUE(driver_.isRunning());
    EXPECT_EQ(driver_.width(), 128u);
    EXPECT_EQ(driver_.height(), 64u);
    EXPECT_STREQ(driver_.name(), "null");
}

TEST_F(NullVideoDriverTest, InitTwiceFails) {
    ASSERT_EQ(driver_.init(128, 64), Result::Success);
    EXPECT_EQ(driver_.init(128, 64), Result::AlreadyInitialized);
}

TEST_F(NullVideoDriverTest, InitZeroSizeFails) {
    EXPECT_EQ(driver_.init(0, 64), Result::InvalidParameter);
    EXPECT_FALSE(driver_.isRunning());
}

TEST_F(NullVideoDriverTest, RenderBeforeInitFails) {
    EXPECT_EQ(driver_.render(frame()), Result::NotInitialized);
}

TEST_F(NullVideoDriverTest, RenderCountsFrames) {
    ASSERT_EQ(driver_.init(128, 64), Result::Success);
    for (int i = 0; i < 3; ++i) {
        EXPECT_EQ(driver_.render(frame()), Result::Success);
    }
    EXPECT_EQ(driver_.framesRendered(), 3u);
    EXPECT_TRUE(driver_.lastFrame().empty());
}

TEST_F(NullVideoDriverTest, RenderRejectsShortBuffer) {
    ASSERT_EQ(driver_.init(128, 64), Result::Success);
    RgbFrame bad{std::span<const uint8_t>(pixels_).first(100), 128, 64};
    EXPECT_EQ(driver_.render(bad), Result::InvalidParameter);
    EXPECT_EQ(driver_.framesRendered(), 0u);
}

TEST_F(NullVideoDriverTest, CaptureKeepsLastFrame) {
    ASSERT_EQ(driver_.init(128, 64), Result::Success);
    driver_.setCaptureFrames(true);
    pixels_[0] = 0x12;
    ASSERT_EQ(driver_.render(frame()), Result::Success);
    ASSERT_EQ(driver_.lastFrame().size(), pixels_.size());
    EXPECT_EQ(driver_.lastFrame()[0], 0x12);
}

TEST_F(NullVideoDriverTest, CloseStopsRunning) {
    ASSERT_EQ(driver_.init(128, 64), Result::Success);
    driver_.close();
    EXPECT_FALSE(driver_.isRunning());
    EXPECT_EQ(driver_.render(frame()), Result::NotInitialized);
    driver_.close();  // Idempotent
}

// ═══════════════════════════════════════════════════════════════════════════
// NullAudioDriver
// ═══════════════════════════════════════════════════════════════════════════

class NullAudioDriverTest : public ::testing::Test {
protected:
    AudioBuffer stereo(const std::vector<int16_t>& samples) const {
        AudioBuffer buf;
        buf.channels = 2;
        buf.s16 = samples;
        return buf;
    }
};

TEST_F(NullAudioDriverTest, InitAdoptsSampleRate) {
    NullAudioDriver driver;
    ASSERT_EQ(driver.init(48000), Result::Success);
    EXPECT_EQ(driver.getConfig().sample_rate, 48000u);
    EXPECT_EQ(driver.getConfig().channels, 2u);
    EXPECT_EQ(driver.droppedSamples(), 0u);
}

TEST_F(NullAudioDriverTest, InitZeroRateFails) {
    NullAudioDriver driver;
    EXPECT_EQ(driver.init(0), Result::InvalidParameter);
}

TEST_F(NullAudioDriverTest, PreferredLayoutIsAdvertised) {
    AudioConfig preferred;
    preferred.channels = 1;
    preferred.format = SampleFormat::F32;
    NullAudioDriver driver(preferred);
    ASSERT_EQ(driver.init(22050), Result::Success);
    EXPECT_EQ(driver.getConfig().channels, 1u);
    EXPECT_EQ(driver.getConfig().format, SampleFormat::F32);
}

TEST_F(NullAudioDriverTest, PlayCountsBlocksAndFrames) {
    NullAudioDriver driver;
    ASSERT_EQ(driver.init(44100), Result::Success);
    std::vector<int16_t> samples{1, 2, 3, 4, 5, 6};
    EXPECT_EQ(driver.playSamples(stereo(samples)), Result::Success);
    EXPECT_EQ(driver.playSamples(stereo(samples)), Result::Success);
    EXPECT_EQ(driver.blocksReceived(), 2u);
    EXPECT_EQ(driver.framesReceived(), 6u);
    EXPECT_EQ(driver.lastS16(), samples);
}

TEST_F(NullAudioDriverTest, PlayRejectsLayoutMismatch) {
    NullAudioDriver driver;
    ASSERT_EQ(driver.init(44100), Result::Success);
    std::vector<int16_t> samples{1, 2};
    AudioBuffer mono;
    mono.channels = 1;
    mono.s16 = samples;
    EXPECT_EQ(driver.playSamples(mono), Result::InvalidParameter);
    EXPECT_EQ(driver.blocksReceived(), 0u);
}

TEST_F(NullAudioDriverTest, PlayBeforeInitFails) {
    NullAudioDriver driver;
    std::vector<int16_t> samples{1, 2};
    EXPECT_EQ(driver.playSamples(stereo(samples)), Result::NotInitialized);
}

// ═══════════════════════════════════════════════════════════════════════════
// NullInputDriver
// ═══════════════════════════════════════════════════════════════════════════

TEST(NullInputDriverTest, PollReturnsInjectedState) {
    NullInputDriver driver;
    ASSERT_EQ(driver.init(), Result::Success);
    driver.press(Button::A);
    driver.press(Button::Right);

    InputState s = driver.poll();
    EXPECT_TRUE(s.isPressed(Button::A));
    EXPECT_TRUE(s.isPressed(Button::Right));
    EXPECT_FALSE(s.isPressed(Button::B));

    driver.release(Button::A);
    EXPECT_FALSE(driver.poll().isPressed(Button::A));
    EXPECT_EQ(driver.pollCount(), 2u);
}

TEST(NullInputDriverTest, ResetIsDeliveredOnce) {
    NullInputDriver driver;
    ASSERT_EQ(driver.init(), Result::Success);
    driver.requestReset();
    EXPECT_TRUE(driver.poll().reset);
    EXPECT_FALSE(driver.poll().reset);
}

TEST(NullInputDriverTest, QuitPersists) {
    NullInputDriver driver;
    ASSERT_EQ(driver.init(), Result::Success);
    driver.requestQuit();
    EXPECT_TRUE(driver.poll().quit);
    EXPECT_TRUE(driver.poll().quit);
}

TEST(NullInputDriverTest, InitTwiceFails) {
    NullInputDriver driver;
    ASSERT_EQ(driver.init(), Result::Success);
    EXPECT_EQ(driver.init(), Result::AlreadyInitialized);
}

// ═══════════════════════════════════════════════════════════════════════════
// Host Clocks
// ═══════════════════════════════════════════════════════════════════════════

TEST(HostClockTest, VirtualClockStartsAtZero) {
    VirtualHostClock clock;
    EXPECT_EQ(clock.getTicksUs(), 0u);
    ASSERT_EQ(clock.initialize(), Result::Success);
    EXPECT_EQ(clock.getTicksUs(), 0u);
    EXPECT_EQ(clock.initialize(), Result::AlreadyInitialized);
}

TEST(HostClockTest, VirtualSleepAdvancesTime) {
    VirtualHostClock clock;
    ASSERT_EQ(clock.initialize(), Result::Success);
    clock.sleepUs(16667);
    clock.sleepUs(16667);
    EXPECT_EQ(clock.getTicksUs(), 33334u);
    EXPECT_EQ(clock.totalSleptUs(), 33334u);
    EXPECT_EQ(clock.sleepCalls(), 2u);
}

TEST(HostClockTest, VirtualSleepWithoutAutoAdvance) {
    VirtualHostClock clock;
    ASSERT_EQ(clock.initialize(), Result::Success);
    clock.setAutoAdvanceOnSleep(false);
    clock.sleepUs(1000);
    EXPECT_EQ(clock.getTicksUs(), 0u);
    clock.advanceTicksUs(250);
    EXPECT_EQ(clock.getTicksUs(), 250u);
    clock.setTicksUs(5000);
    EXPECT_EQ(clock.getTicksUs(), 5000u);
}

TEST(HostClockTest, SteadyClockIsMonotonic) {
    SteadyHostClock clock;
    ASSERT_EQ(clock.initialize(), Result::Success);
    uint64_t t1 = clock.getTicksUs();
    clock.sleepUs(2000);
    uint64_t t2 = clock.getTicksUs();
    EXPECT_GE(t2, t1 + 1000);
    clock.shutdown();
    EXPECT_EQ(clock.getTicksUs(), 0u);
}

// ═══════════════════════════════════════════════════════════════════════════
// Factories
// ═══════════════════════════════════════════════════════════════════════════

TEST(PlatformTest, NullBackendAlwaysAvailable) {
    EXPECT_TRUE(isBackendAvailable(Backend::Null));
    EXPECT_NE(createVideoDriver(Backend::Null), nullptr);
    EXPECT_NE(createAudioDriver(Backend::Null), nullptr);
    EXPECT_NE(createInputDriver(Backend::Null), nullptr);
    EXPECT_NE(createHostClock(Backend::Null), nullptr);
}

TEST(PlatformTest, NullAudioUsesRequestedLayout) {
    DriverOptions options;
    options.audio_channels = 1;
    options.audio_format = SampleFormat::F32;
    auto audio = createAudioDriver(Backend::Null, options);
    ASSERT_NE(audio, nullptr);
    ASSERT_EQ(audio->init(44100), Result::Success);
    EXPECT_EQ(audio->getConfig().channels, 1u);
    EXPECT_EQ(audio->getConfig().format, SampleFormat::F32);
}

TEST(PlatformTest, MissingBackendYieldsNull) {
    for (Backend b : {Backend::SDL2, Backend::SDL3}) {
        if (isBackendAvailable(b)) {
            continue;
        }
        EXPECT_EQ(createVideoDriver(b), nullptr);
        EXPECT_EQ(createAudioDriver(b), nullptr);
        EXPECT_EQ(createInputDriver(b), nullptr);
        EXPECT_EQ(createHostClock(b), nullptr);
    }
}

} // namespace
} // namespace apal
