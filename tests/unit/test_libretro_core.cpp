// SPDX-License-Identifier: GPL-2.0-or-later
// Copyright (C) 2025 Arduplay Contributors
//
// The libretro loader's failure paths. These need no real core and hold
// whether or not the build found libretro.h.

#include <gtest/gtest.h>
#include "arduplay/libretro_core.h"
#include "arduplay/session_bridge.h"
#include "fake_core.h"

#include <cstdint>
#include <span>
#include <string>

namespace arduplay {
namespace {

TEST(LibretroFactoryTest, MissingCoreIsCoreLoadError) {
    test::TempDir dir;
    auto factory = make_libretro_factory();
    auto core = factory(dir.path() / "arduous_libretro.so");
    ASSERT_FALSE(core.has_value());
    EXPECT_EQ(core.error().code(), ErrorCode::CoreLoadError);
    EXPECT_NE(core.error().message().find("arduous_libretro.so"), std::string::npos);
}

TEST(LibretroFactoryTest, NonLibraryIsCoreLoadError) {
    test::TempDir dir;
    auto path = dir.write("notacore_libretro.so", "this is not an ELF file\n");
    auto core = make_libretro_factory()(path);
    ASSERT_FALSE(core.has_value());
    EXPECT_EQ(core.error().code(), ErrorCode::CoreLoadError);
}

TEST(LibretroFactoryTest, BridgeReportsLoadFailure) {
    test::TempDir dir;
    auto content = dir.write("arcodia.hex", ":00000001FF\n");
    SessionBridge bridge(make_libretro_factory());

    auto result = bridge.initialize(dir.path() / "absent_libretro.so", content);
    ASSERT_FALSE(result.has_value());
    EXPECT_EQ(result.error().code(), ErrorCode::CoreLoadError);
    EXPECT_EQ(bridge.state(), SessionState::Uninitialized);
}

TEST(LibretroFactoryTest, DefaultPixelFormatIs0RGB1555) {
    EXPECT_EQ(kLibretroDefaultPixelFormat, PixelFormat::RGB1555);

    // Pure red from a core that never announced its format
    const uint16_t red = 0x7C00;
    NativeFrame frame;
    frame.data = std::span<const uint8_t>(reinterpret_cast<const uint8_t*>(&red), sizeof(red));
    frame.width = 1;
    frame.height = 1;
    frame.pitch = sizeof(red);
    frame.format = kLibretroDefaultPixelFormat;

    RgbImage image;
    ASSERT_TRUE(to_rgb888(frame, image).has_value());
    EXPECT_EQ(image.at(0, 0), (Rgb888{255, 0, 0}));
}

TEST(LibretroFactoryTest, AvailabilityMatchesBuild) {
#ifdef ARDUPLAY_HAS_LIBRETRO
    EXPECT_TRUE(libretro_available());
#else
    EXPECT_FALSE(libretro_available());
#endif
}

} // namespace
} // namespace arduplay
