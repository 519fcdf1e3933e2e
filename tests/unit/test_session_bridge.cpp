// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors

#include <gtest/gtest.h>
#include "arduplay/session_bridge.h"
#include "fake_core.h"

#include <memory>
#include <stdexcept>

namespace arduplay {
namespace {

class SessionBridgeTest : public ::testing::Test {
protected:
    void SetUp() override {
        content_ = dir_.write("arcodia.hex", ":00000001FF\n");
        probe_ = std::make_shared<test::FakeCoreProbe>();
    }

    std::unique_ptr<SessionBridge> make_bridge(test::FakeCoreOptions options = {}) {
        return std::make_unique<SessionBridge>(test::make_fake_factory(options, probe_));
    }

    /// Initialized and started with default options
    std::unique_ptr<SessionBridge> running_bridge(test::FakeCoreOptions options = {}) {
        auto bridge = make_bridge(options);
        EXPECT_TRUE(bridge->initialize("fake_libretro.so", content_).has_value());
        EXPECT_TRUE(bridge->start().has_value());
        return bridge;
    }

    test::TempDir dir_;
    std::filesystem::path content_;
    std::shared_ptr<test::FakeCoreProbe> probe_;
};

// ═══════════════════════════════════════════════════════════════════════════
// Lifecycle Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SessionBridgeTest, StartsUninitialized) {
    auto bridge = make_bridge();
    EXPECT_EQ(bridge->state(), SessionState::Uninitialized);
    EXPECT_FALSE(bridge->is_running());
    EXPECT_EQ(bridge->frames_run(), 0u);
}

TEST_F(SessionBridgeTest, InitializeLoadsCoreAndContent) {
    auto bridge = make_bridge();
    auto result = bridge->initialize("fake_libretro.so", content_);
    ASSERT_TRUE(result.has_value()) << result.error().format();

    EXPECT_EQ(bridge->state(), SessionState::Initialized);
    EXPECT_EQ(bridge->info().width, 128u);
    EXPECT_EQ(bridge->info().height, 64u);
    EXPECT_EQ(bridge->info().name, "fake");
    EXPECT_EQ(bridge->content_id(), "arcodia");
    EXPECT_EQ(probe_->created, 1);
}

TEST_F(SessionBridgeTest, InitializeTwiceIsNoOp) {
    auto bridge = make_bridge();
    ASSERT_TRUE(bridge->initialize("fake_libretro.so", content_).has_value());
    EXPECT_TRUE(bridge->initialize("fake_libretro.so", content_).has_value());
    EXPECT_EQ(probe_->created, 1);
}

TEST_F(SessionBridgeTest, MissingCoreIsCoreLoadError) {
    auto bridge = make_bridge();
    auto result = bridge->initialize("missing_libretro.so", content_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CoreLoadError);
    EXPECT_EQ(bridge->state(), SessionState::Uninitialized);
}

TEST_F(SessionBridgeTest, EmptyFactoryIsCoreLoadError) {
    SessionBridge bridge{CoreFactory{}};
    auto result = bridge.initialize("fake_libretro.so", content_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CoreLoadError);
}

TEST_F(SessionBridgeTest, ThrowingFactoryIsCoreLoadError) {
    SessionBridge bridge([](const std::filesystem::path&) -> Result<std::unique_ptr<ICore>> {
        throw std::runtime_error("dlopen exploded");
    });
    auto result = bridge.initialize("fake_libretro.so", content_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CoreLoadError);
    EXPECT_NE(result.error().message().find("dlopen exploded"), std::string::npos);
}

TEST_F(SessionBridgeTest, MissingContentIsContentLoadError) {
    auto bridge = make_bridge();
    auto result = bridge->initialize("fake_libretro.so", dir_.path() / "nothing.hex");
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadError);
    EXPECT_EQ(bridge->state(), SessionState::Uninitialized);
}

TEST_F(SessionBridgeTest, RejectedContentIsContentLoadError) {
    test::FakeCoreOptions options;
    options.reject_content = true;
    auto bridge = make_bridge(options);
    auto result = bridge->initialize("fake_libretro.so", content_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadError);
}

TEST_F(SessionBridgeTest, EmptyGeometryIsContentLoadError) {
    test::FakeCoreOptions options;
    options.report_empty_geometry = true;
    auto bridge = make_bridge(options);
    auto result = bridge->initialize("fake_libretro.so", content_);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::ContentLoadError);
}

TEST_F(SessionBridgeTest, StartBeforeInitializeFails) {
    auto bridge = make_bridge();
    auto result = bridge->start();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
}

TEST_F(SessionBridgeTest, StartStopRestart) {
    auto bridge = running_bridge();
    EXPECT_TRUE(bridge->is_running());
    EXPECT_TRUE(bridge->start().has_value());  // Idempotent

    bridge->stop();
    EXPECT_EQ(bridge->state(), SessionState::Stopped);
    EXPECT_FALSE(bridge->run_frame().has_value());
}

TEST_F(SessionBridgeTest, CleanupUnloadsAndIsIdempotent) {
    auto bridge = running_bridge();
    bridge->cleanup();
    EXPECT_EQ(bridge->state(), SessionState::Uninitialized);
    EXPECT_EQ(probe_->unloaded, 1);
    bridge->cleanup();
    EXPECT_EQ(probe_->unloaded, 1);
}

TEST_F(SessionBridgeTest, DestructorCleansUp) {
    {
        auto bridge = running_bridge();
    }
    EXPECT_EQ(probe_->unloaded, 1);
}

// ═══════════════════════════════════════════════════════════════════════════
// Frame Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SessionBridgeTest, RunFrameBeforeStartFails) {
    auto bridge = make_bridge();
    ASSERT_TRUE(bridge->initialize("fake_libretro.so", content_).has_value());
    auto result = bridge->run_frame();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
}

TEST_F(SessionBridgeTest, FrameUnavailableBeforeFirstRun) {
    auto bridge = running_bridge();
    EXPECT_FALSE(bridge->get_frame().has_value());
    EXPECT_FALSE(bridge->get_audio_samples().has_value());
}

TEST_F(SessionBridgeTest, RunFrameAdvancesOneFrame) {
    auto bridge = running_bridge();
    ASSERT_TRUE(bridge->run_frame().has_value());
    ASSERT_TRUE(bridge->run_frame().has_value());

    EXPECT_EQ(bridge->frames_run(), 2u);
    EXPECT_EQ(probe_->last->emulated_frame(), 2u);

    auto frame = bridge->get_frame();
    ASSERT_TRUE(frame.has_value());
    EXPECT_EQ(frame->width, 128u);
    EXPECT_EQ(frame->height, 64u);
    EXPECT_EQ(frame->format, PixelFormat::RGB565);
    EXPECT_EQ(frame->data.size(), 128u * 64u * 2u);

    auto audio = bridge->get_audio_samples();
    ASSERT_TRUE(audio.has_value());
    EXPECT_EQ(audio->sample_count(), 735u);
    EXPECT_EQ(audio->channels, 1u);
}

TEST_F(SessionBridgeTest, InputIsLatchedForNextFrame) {
    auto bridge = running_bridge();
    apal::InputState input;
    input.setPressed(apal::Button::A, true);
    ASSERT_TRUE(bridge->set_input_state(input).has_value());

    // Latest state wins
    input.setPressed(apal::Button::B, true);
    ASSERT_TRUE(bridge->set_input_state(input).has_value());

    ASSERT_TRUE(bridge->run_frame().has_value());
    EXPECT_TRUE(probe_->last->input().isPressed(apal::Button::A));
    EXPECT_TRUE(probe_->last->input().isPressed(apal::Button::B));
}

TEST_F(SessionBridgeTest, SetInputBeforeInitializeFails) {
    auto bridge = make_bridge();
    auto result = bridge->set_input_state({});
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
}

TEST_F(SessionBridgeTest, CoreThrowIsStepErrorAndFailsSession) {
    test::FakeCoreOptions options;
    options.throw_on_frame = 3;
    auto bridge = running_bridge(options);

    ASSERT_TRUE(bridge->run_frame().has_value());
    ASSERT_TRUE(bridge->run_frame().has_value());
    auto result = bridge->run_frame();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::StepError);
    EXPECT_NE(result.error().message().find("illegal opcode"), std::string::npos);
    EXPECT_EQ(bridge->state(), SessionState::Failed);
    EXPECT_EQ(bridge->frames_run(), 2u);
}

TEST_F(SessionBridgeTest, FailedSessionNeedsCleanup) {
    test::FakeCoreOptions options;
    options.throw_on_frame = 1;
    auto bridge = running_bridge(options);
    ASSERT_FALSE(bridge->run_frame().has_value());

    EXPECT_FALSE(bridge->run_frame().has_value());
    EXPECT_FALSE(bridge->initialize("fake_libretro.so", content_).has_value());

    bridge->cleanup();
    EXPECT_EQ(bridge->state(), SessionState::Uninitialized);
    EXPECT_TRUE(bridge->initialize("fake_libretro.so", content_).has_value());
}

// ═══════════════════════════════════════════════════════════════════════════
// Serialization Tests
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SessionBridgeTest, SerializeRoundTripRestoresFrame) {
    auto bridge = running_bridge();
    for (int i = 0; i < 5; ++i) {
        ASSERT_TRUE(bridge->run_frame().has_value());
    }
    auto blob = bridge->serialize();
    ASSERT_TRUE(blob.has_value());
    EXPECT_EQ(blob->size(), bridge->serialize_size());

    const auto before = bridge->get_frame();
    ASSERT_TRUE(before.has_value());
    const std::vector<uint8_t> pixels_before(before->data.begin(), before->data.end());

    for (int i = 0; i < 3; ++i) {
        ASSERT_TRUE(bridge->run_frame().has_value());
    }
    ASSERT_TRUE(bridge->deserialize(*blob).has_value());

    const auto after = bridge->get_frame();
    ASSERT_TRUE(after.has_value());
    EXPECT_EQ(std::vector<uint8_t>(after->data.begin(), after->data.end()), pixels_before);
    EXPECT_EQ(probe_->last->emulated_frame(), 5u);
}

TEST_F(SessionBridgeTest, SerializeThenDeserializeLeavesFrameUnchanged) {
    auto bridge = running_bridge();
    ASSERT_TRUE(bridge->run_frame().has_value());
    auto blob = bridge->serialize();
    ASSERT_TRUE(blob.has_value());
    ASSERT_TRUE(bridge->deserialize(*blob).has_value());
    EXPECT_EQ(probe_->last->emulated_frame(), 1u);
}

TEST_F(SessionBridgeTest, SerializeUnsupported) {
    test::FakeCoreOptions options;
    options.serializable = false;
    auto bridge = running_bridge(options);
    EXPECT_EQ(bridge->serialize_size(), 0u);

    auto blob = bridge->serialize();
    ASSERT_FALSE(blob.has_value());
    EXPECT_EQ(blob.error().code(), ErrorCode::UnsupportedBySession);

    std::vector<uint8_t> junk(24);
    auto restored = bridge->deserialize(junk);
    ASSERT_FALSE(restored.has_value());
    EXPECT_EQ(restored.error().code(), ErrorCode::UnsupportedBySession);
}

TEST_F(SessionBridgeTest, GarbageBlobRejected) {
    auto bridge = running_bridge();
    std::vector<uint8_t> junk(24, 0xAB);
    auto result = bridge->deserialize(junk);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::DeserializeRejected);
    EXPECT_TRUE(bridge->is_running());
}

TEST_F(SessionBridgeTest, SerializeBeforeInitializeFails) {
    auto bridge = make_bridge();
    EXPECT_EQ(bridge->serialize_size(), 0u);
    auto blob = bridge->serialize();
    ASSERT_FALSE(blob.has_value());
    EXPECT_EQ(blob.error().code(), ErrorCode::InvalidState);
}

// ═══════════════════════════════════════════════════════════════════════════
// Reset / Reload
// ═══════════════════════════════════════════════════════════════════════════

TEST_F(SessionBridgeTest, ResetRestartsCore) {
    auto bridge = running_bridge();
    ASSERT_TRUE(bridge->run_frame().has_value());
    ASSERT_TRUE(bridge->reset().has_value());
    EXPECT_EQ(probe_->last->emulated_frame(), 0u);
    EXPECT_EQ(probe_->last->resets(), 1u);
    EXPECT_TRUE(bridge->is_running());
}

TEST_F(SessionBridgeTest, ResetThrowFailsSession) {
    test::FakeCoreOptions options;
    options.throw_on_reset = true;
    auto bridge = running_bridge(options);
    auto result = bridge->reset();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::StepError);
    EXPECT_EQ(bridge->state(), SessionState::Failed);
}

TEST_F(SessionBridgeTest, ReloadCreatesFreshCore) {
    auto bridge = running_bridge();
    ASSERT_TRUE(bridge->run_frame().has_value());
    ASSERT_TRUE(bridge->reload().has_value());

    EXPECT_EQ(probe_->created, 2);
    EXPECT_EQ(probe_->unloaded, 1);
    EXPECT_EQ(bridge->frames_run(), 0u);
    EXPECT_TRUE(bridge->is_running());
}

TEST_F(SessionBridgeTest, ReloadBeforeInitializeFails) {
    auto bridge = make_bridge();
    auto result = bridge->reload();
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::InvalidState);
}

} // namespace
} // namespace arduplay
