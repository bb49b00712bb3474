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
#include "geometry/musicmodegeometry.h"

TEST(MusicModeGeometryTest, DefaultConstructedHasHiddenVideo)
{
    const MusicModeGeometry geometry;
    EXPECT_FALSE(geometry.isVideoVisible());
    EXPECT_FALSE(geometry.isPlaylistVisible());
    EXPECT_FALSE(geometry.videoSize().has_value());
    EXPECT_EQ(geometry.windowFrame().size(), QSizeF(280, 72));
}

TEST(MusicModeGeometryTest, DefaultGeometrySitsAtTopLeftOfVisibleFrame)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    EXPECT_EQ(geometry.windowFrame(), QRectF(0, 825, 280, 230));
    EXPECT_EQ(geometry.screenID(), QStringLiteral("main"));
    EXPECT_EQ(geometry.videoHeight(), 158);
    EXPECT_EQ(geometry.playlistHeight(), MusicModeConst::DEFAULT_PLAYLIST_HEIGHT);
}

TEST(MusicModeGeometryTest, RefitEnforcesMinimumWidth)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9)
                                           .withWindowFrame(QRectF(0, 825, 100, 230));
    const MusicModeGeometry fitted = geometry.refit(geometryContext());
    EXPECT_EQ(fitted.windowFrame(), QRectF(0, 825, 260, 218));
}

TEST(MusicModeGeometryTest, RefitKeepsControlBarOnScreen)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9)
                                           .withWindowFrame(QRectF(0, 825, 3000, 230));
    const MusicModeGeometry fitted = geometry.refit(geometryContext());
    EXPECT_EQ(fitted.windowFrame().width(), 1748);
    EXPECT_EQ(fitted.windowFrame().height(), 1055);
    EXPECT_EQ(fitted.windowFrame().y(), 0);
}

TEST(MusicModeGeometryTest, RefitWithoutVideoUsesMaxWindowWidth)
{
    const MusicModeGeometry geometry(QRectF(0, 0, 3000, 72), QStringLiteral("main"),
                                     MusicModeConst::DEFAULT_PLAYLIST_HEIGHT, false, false, ASPECT_16_9);
    EXPECT_EQ(geometry.refit(geometryContext()).windowFrame().width(), 1920);

    LayoutPreferences prefs;
    prefs.musicModeMaxWindowWidth = 500;
    EXPECT_EQ(geometry.refit(geometryContext(prefs)).windowFrame().width(), 500);
}

TEST(MusicModeGeometryTest, ScaleVideoRequiresVisibleVideo)
{
    const MusicModeGeometry hidden = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9, false);
    EXPECT_FALSE(hidden.scaleVideo(geometryContext(), QSizeF(640, 360)).has_value());
}

TEST(MusicModeGeometryTest, ScaleVideoKeepsWindowHeight)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    const std::optional<MusicModeGeometry> scaled = geometry.scaleVideo(geometryContext(), QSizeF(200, 112));
    ASSERT_TRUE(scaled.has_value());
    // Clamped up to the minimum width
    EXPECT_EQ(scaled->windowFrame().width(), MusicModeConst::MIN_WINDOW_WIDTH);
    EXPECT_EQ(scaled->windowFrame().height(), 230);
    EXPECT_EQ(scaled->windowFrame().x(), 0);
}

TEST(MusicModeGeometryTest, ConvertsToWindowGeometryWithOutsideBottomBar)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    const WindowGeometry windowGeometry = geometry.toWindowGeometry();
    EXPECT_EQ(windowGeometry.mode(), WindowMode::MusicMode);
    EXPECT_EQ(windowGeometry.fitOption(), ScreenFitOption::KeepInVisibleScreen);
    EXPECT_EQ(windowGeometry.outsideBars(), BoxQuad(0, 0, 72, 0));
    EXPECT_EQ(windowGeometry.windowFrame(), geometry.windowFrame());

    const WindowGeometry withPlaylist = geometry.withPlaylistVisible(true).toWindowGeometry();
    EXPECT_GT(withPlaylist.outsideBars().bottom, 72 + MusicModeConst::MIN_PLAYLIST_HEIGHT);
}

TEST(MusicModeGeometryTest, OpeningPlaylistKeepsTopEdge)
{
    const MusicModeGeometry geometry = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9);
    const MusicModeGeometry withPlaylist = geometry.withPlaylistVisible(true);
    EXPECT_TRUE(withPlaylist.isPlaylistVisible());
    EXPECT_EQ(withPlaylist.windowFrame().height(), 530);
    EXPECT_EQ(RectUtil::maxY(withPlaylist.windowFrame()), 1055);
    EXPECT_EQ(geometry.withPlaylistVisible(false), geometry);
}

TEST(MusicModeGeometryTest, ShowingVideoGrowsWindow)
{
    const MusicModeGeometry hidden = MusicModeGeometry::defaultGeometry(mainScreen(), ASPECT_16_9, false);
    EXPECT_EQ(hidden.windowFrame().height(), 72);

    const MusicModeGeometry shown = hidden.withVideoViewVisible(true);
    EXPECT_TRUE(shown.isVideoVisible());
    EXPECT_EQ(shown.windowFrame().height(), 230);
    ASSERT_TRUE(shown.videoSize().has_value());
    EXPECT_EQ(*shown.videoSize(), QSizeF(280, 158));
}
