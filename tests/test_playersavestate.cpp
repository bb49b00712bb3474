/*
* ========================================================================== *
*                                                                            *
*    This file is part of the Letterbox player window layout engine          *
*                                                                            *
*    Copyright (C) 2024   <info@openterface.com>                             *
*                                                                            *
*    This program is free software: you can redistribute it and/or modify    *
*    it under the terms of the GNU General Public License as published by    *
*    the Free Software Foundation version 3.                                 *
*                                                                            *
*    This program is distributed in the hope that it will be useful, but     *
*    WITHOUT ANY WARRANTY; without even the implied warranty of              *
*    MERCHANTABILITY or FITNESS FOR A PARTICULAR PURPOSE. See the GNU        *
*    General Public License for more details.                                *
*                                                                            *
*    You should have received a copy of the GNU General Public License       *
*    along with this program. If not, see <http://www.gnu.org/licenses/>.    *
*                                                                            *
* ========================================================================== *
*/

#include "testutil.h"
#include "state/playersavestate.h"

namespace {

LayoutSpec savedSpec(const LayoutPreferences &prefs)
{
    const LayoutSpec base = LayoutSpec::fromPreferences(prefs, LayoutSpec());
    LayoutSpecChanges changes;
    changes.leadingSidebar = base.leadingSidebar().withVisibleTab(SidebarTab(SidebarTab::Video));
    changes.topBarPlacement = PanelPlacement::OutsideViewport;
    changes.oscPosition = OSCPosition::Top;
    return base.withChanges(changes);
}

WindowGeometry savedGeometry()
{
    return WindowGeometry(QRectF(100, 200, 1280, 764), "main", ScreenFitOption::KeepInVisibleScreen,
                          WindowMode::Windowed, 0, BoxQuad(44, 0, 0, 0), BoxQuad(), ASPECT_16_9);
}

} // namespace

TEST(PlayerSaveStateTest, EncodesLayoutSpec)
{
    const LayoutPreferences prefs;
    const QString csv = PlayerSaveState::encode(savedSpec(prefs));
    EXPECT_EQ(csv, QStringLiteral("1,video,nil,1,N,1,0,0,0,Y,1"));

    const std::optional<LayoutSpec> decoded = PlayerSaveState::decodeLayoutSpec(csv, prefs);
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(*decoded, savedSpec(prefs));
}

TEST(PlayerSaveStateTest, EncodesWindowGeometry)
{
    const QString csv = PlayerSaveState::encode(savedGeometry());
    EXPECT_EQ(csv, QStringLiteral("1,1280.00,720.00,1.777778,44.00,0.00,0.00,0.00,100.00,200.00,1280.00,764.00"));

    const std::optional<WindowGeometry> decoded = PlayerSaveState::decodeWindowGeometry(csv, "main");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->windowFrame(), savedGeometry().windowFrame());
    EXPECT_EQ(decoded->outsideBars(), savedGeometry().outsideBars());
    EXPECT_EQ(decoded->screenID(), QStringLiteral("main"));
    EXPECT_TRUE(RectUtil::isSameAspect(decoded->videoAspect(), ASPECT_16_9));
    EXPECT_EQ(decoded->videoSize(), QSizeF(1280, 720));
}

TEST(PlayerSaveStateTest, EncodesMusicModeGeometry)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    const QString csv = PlayerSaveState::encode(geometry);
    EXPECT_EQ(csv, QStringLiteral("1,0.00,825.00,280.00,230.00,300.00,Y,N,1.777778"));

    const std::optional<MusicModeGeometry> decoded = PlayerSaveState::decodeMusicModeGeometry(csv, "main");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_EQ(decoded->windowFrame(), geometry.windowFrame());
    EXPECT_EQ(decoded->playlistHeight(), 300);
    EXPECT_TRUE(decoded->isVideoVisible());
    EXPECT_FALSE(decoded->isPlaylistVisible());
}

TEST(PlayerSaveStateTest, AcceptsAlternateBooleanSpellings)
{
    const std::optional<MusicModeGeometry> decoded =
        PlayerSaveState::decodeMusicModeGeometry("1,0,825,280,230,300,true,0,1.777778", "main");
    ASSERT_TRUE(decoded.has_value());
    EXPECT_TRUE(decoded->isVideoVisible());
    EXPECT_FALSE(decoded->isPlaylistVisible());
}

TEST(PlayerSaveStateTest, RejectsMalformedLayoutSpec)
{
    const LayoutPreferences prefs;
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("1,video,nil", prefs).has_value());
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("2,video,nil,1,N,1,0,0,0,Y,1", prefs).has_value());
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("1,bogus,nil,1,N,1,0,0,0,Y,1", prefs).has_value());
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("1,video,nil,7,N,1,0,0,0,Y,1", prefs).has_value());
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("1,video,nil,1,maybe,1,0,0,0,Y,1", prefs).has_value());
    EXPECT_FALSE(PlayerSaveState::decodeLayoutSpec("1,video,nil,1,N,1,0,0,0,Y,3", prefs).has_value());
}

TEST(PlayerSaveStateTest, RejectsMalformedGeometry)
{
    EXPECT_FALSE(PlayerSaveState::decodeWindowGeometry("1,1280,720", "main").has_value());
    EXPECT_FALSE(PlayerSaveState::decodeWindowGeometry("1,abc,720,1.7,0,0,0,0,0,0,1280,720", "main").has_value());
    EXPECT_FALSE(PlayerSaveState::decodeWindowGeometry("1,1280,720,0,0,0,0,0,0,0,1280,720", "main").has_value());
    // Outside bars taller than the window
    EXPECT_FALSE(PlayerSaveState::decodeWindowGeometry("1,1280,720,1.7,900,0,0,0,0,0,1280,720", "main").has_value());

    EXPECT_FALSE(PlayerSaveState::decodeMusicModeGeometry("1,0,0,280,72,300,N,N", "main").has_value());
    EXPECT_FALSE(PlayerSaveState::decodeMusicModeGeometry("1,0,0,280,72,300,N,N,-1", "main").has_value());
}

TEST(PlayerSaveStateTest, PropertiesRoundTrip)
{
    const LayoutPreferences prefs;
    PlayerSaveState state;
    state.layoutSpec = savedSpec(prefs);
    state.windowedModeGeometry = savedGeometry();
    state.musicModeGeometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    state.videoAspect = 2.0;

    const QVariantMap properties = state.toProperties();
    EXPECT_EQ(properties.value(PlayerSaveState::KEY_SCREEN_ID).toString(), QStringLiteral("main"));
    EXPECT_EQ(properties.value(PlayerSaveState::KEY_VIDEO_ASPECT).toString(), QStringLiteral("2.000000"));

    const PlayerSaveState restored = PlayerSaveState::fromProperties(properties, prefs);
    ASSERT_TRUE(restored.layoutSpec.has_value());
    EXPECT_EQ(*restored.layoutSpec, *state.layoutSpec);
    ASSERT_TRUE(restored.windowedModeGeometry.has_value());
    EXPECT_EQ(restored.windowedModeGeometry->windowFrame(), state.windowedModeGeometry->windowFrame());
    ASSERT_TRUE(restored.musicModeGeometry.has_value());
    EXPECT_EQ(restored.musicModeGeometry->screenID(), QStringLiteral("main"));
    EXPECT_EQ(restored.videoAspect, 2.0);
}

TEST(PlayerSaveStateTest, PartialPropertiesLoadWhatTheyCan)
{
    EXPECT_TRUE(PlayerSaveState::fromProperties(QVariantMap(), LayoutPreferences()).isEmpty());

    QVariantMap properties;
    properties.insert(PlayerSaveState::KEY_LAYOUT_SPEC, "1,nil,playlist,1,N,0,0,0,0,Y,0");
    properties.insert(PlayerSaveState::KEY_WINDOWED_GEOMETRY, "garbage");
    properties.insert(PlayerSaveState::KEY_VIDEO_ASPECT, "abc");

    const PlayerSaveState state = PlayerSaveState::fromProperties(properties, LayoutPreferences());
    EXPECT_FALSE(state.isEmpty());
    ASSERT_TRUE(state.layoutSpec.has_value());
    EXPECT_EQ(state.layoutSpec->trailingSidebar().visibleTab(), SidebarTab(SidebarTab::Playlist));
    EXPECT_FALSE(state.windowedModeGeometry.has_value());
    EXPECT_FALSE(state.musicModeGeometry.has_value());
    EXPECT_FALSE(state.videoAspect.has_value());
}
