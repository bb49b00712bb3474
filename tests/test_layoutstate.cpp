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
#include "layout/layoutstate.h"

namespace {

LayoutState layoutFor(const LayoutPreferences &prefs, WindowMode mode = WindowMode::Windowed,
                      qreal cameraHousingHeight = 0)
{
    const LayoutSpec spec = LayoutSpec::fromPreferences(prefs, LayoutSpec(), mode);
    return LayoutState::fromSpec(spec, LayoutStateOptions::fromPreferences(prefs, cameraHousingHeight));
}

} // namespace

TEST(LayoutStateTest, WindowedWithInsideTopBar)
{
    const LayoutState layout = layoutFor(LayoutPreferences());

    EXPECT_EQ(layout.titleBar(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.trafficLightButtons(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.titleIconAndText(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.titlebarAccessories(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.leadingSidebarToggleButton(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.trailingSidebarToggleButton(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.controlBarFloating(), Visibility::ShowFadeableNonTopBar);
    EXPECT_EQ(layout.bottomBarView(), Visibility::Hidden);

    EXPECT_EQ(layout.titleBarHeight(), TitleBarConst::STANDARD_HEIGHT);
    EXPECT_EQ(layout.topOSCHeight(), 0);
    EXPECT_EQ(layout.osdMinOffsetFromTop(), 36);
    EXPECT_EQ(layout.sidebarDownshift(), 28);
    EXPECT_EQ(layout.sidebarTabHeight(), SidebarConst::DEFAULT_TAB_HEIGHT);

    EXPECT_EQ(layout.insideBars(), BoxQuad(28, 0, 0, 0));
    EXPECT_EQ(layout.outsideBars(), BoxQuad());
    EXPECT_FALSE(layout.hasPermanentOSC());
}

TEST(LayoutStateTest, OutsideTopBarShowsAlways)
{
    LayoutPreferences prefs;
    prefs.topBarPlacement = PanelPlacement::OutsideViewport;
    const LayoutState layout = layoutFor(prefs);

    EXPECT_EQ(layout.titleBar(), Visibility::ShowAlways);
    EXPECT_EQ(layout.topBarView(), Visibility::ShowAlways);
    EXPECT_EQ(layout.osdMinOffsetFromTop(), 0);
    EXPECT_EQ(layout.sidebarDownshift(), SidebarConst::DEFAULT_DOWNSHIFT);
    EXPECT_EQ(layout.outsideBars(), BoxQuad(28, 0, 0, 0));
}

TEST(LayoutStateTest, TopOSCSharesSpaceWithTitleBar)
{
    LayoutPreferences prefs;
    prefs.oscPosition = OSCPosition::Top;
    prefs.topBarPlacement = PanelPlacement::OutsideViewport;
    const LayoutState outside = layoutFor(prefs);

    EXPECT_EQ(outside.titleBarHeight(), TitleBarConst::REDUCED_HEIGHT);
    EXPECT_EQ(outside.topOSCHeight(), 44);
    EXPECT_EQ(outside.topBarHeight(), 64);
    EXPECT_EQ(outside.outsideBars(), BoxQuad(64, 0, 0, 0));
    EXPECT_EQ(outside.controlBarFloating(), Visibility::Hidden);
    EXPECT_TRUE(outside.hasPermanentOSC());

    prefs.topBarPlacement = PanelPlacement::InsideViewport;
    const LayoutState inside = layoutFor(prefs);
    EXPECT_EQ(inside.topBarView(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(inside.sidebarDownshift(), 20);
    EXPECT_EQ(inside.sidebarTabHeight(), 44);
    // Offset is taken from the full title bar height
    EXPECT_EQ(inside.osdMinOffsetFromTop(), 36);
    EXPECT_FALSE(inside.hasPermanentOSC());
}

TEST(LayoutStateTest, TallTopOSCKeepsDefaultTabHeight)
{
    LayoutPreferences prefs;
    prefs.oscPosition = OSCPosition::Top;
    prefs.oscBarHeight = 90;
    EXPECT_EQ(layoutFor(prefs).sidebarTabHeight(), SidebarConst::DEFAULT_TAB_HEIGHT);
}

TEST(LayoutStateTest, BottomOSC)
{
    LayoutPreferences prefs;
    prefs.oscPosition = OSCPosition::Bottom;
    EXPECT_EQ(layoutFor(prefs).bottomBarView(), Visibility::ShowFadeableNonTopBar);
    EXPECT_EQ(layoutFor(prefs).insideBars().bottom, 44);

    prefs.bottomBarPlacement = PanelPlacement::OutsideViewport;
    const LayoutState outside = layoutFor(prefs);
    EXPECT_EQ(outside.bottomBarView(), Visibility::ShowAlways);
    EXPECT_EQ(outside.outsideBars(), BoxQuad(0, 0, 44, 0));
    EXPECT_TRUE(outside.hasPermanentOSC());
}

TEST(LayoutStateTest, LegacyWindowHasNoTitleBar)
{
    LayoutPreferences prefs;
    prefs.useLegacyWindowedMode = true;
    const LayoutState layout = layoutFor(prefs);

    EXPECT_EQ(layout.titleBar(), Visibility::Hidden);
    EXPECT_EQ(layout.titleBarHeight(), 0);
    EXPECT_EQ(layout.leadingSidebarToggleButton(), Visibility::Hidden);
    EXPECT_EQ(layout.topBarView(), Visibility::ShowFadeableTopBar);
    EXPECT_EQ(layout.osdMinOffsetFromTop(), TitleBarConst::OSD_OFFSET);
}

TEST(LayoutStateTest, SidebarToggleButtonsFollowConfiguration)
{
    LayoutPreferences prefs;
    prefs.showLeadingSidebarToggleButton = false;
    prefs.trailingSidebarTabGroups = SidebarTabGroups();
    const LayoutState layout = layoutFor(prefs);
    EXPECT_EQ(layout.leadingSidebarToggleButton(), Visibility::Hidden);
    EXPECT_EQ(layout.trailingSidebarToggleButton(), Visibility::Hidden);
}

TEST(LayoutStateTest, MusicMode)
{
    const LayoutState layout = layoutFor(LayoutPreferences(), WindowMode::MusicMode);

    EXPECT_EQ(layout.bottomBarView(), Visibility::ShowAlways);
    EXPECT_EQ(layout.titleBar(), Visibility::Hidden);
    EXPECT_EQ(layout.controlBarFloating(), Visibility::Hidden);
    EXPECT_EQ(layout.sidebarTabHeight(), SidebarConst::MUSIC_MODE_TAB_HEIGHT);
    EXPECT_EQ(layout.outsideBars(), BoxQuad(0, 0, MusicModeConst::OSC_HEIGHT, 0));
    EXPECT_FALSE(layout.canToggleFullScreen());
}

TEST(LayoutStateTest, FullScreen)
{
    const LayoutState native = layoutFor(LayoutPreferences(), WindowMode::FullScreen, 32);
    EXPECT_EQ(native.titleIconAndText(), Visibility::ShowAlways);
    EXPECT_EQ(native.trafficLightButtons(), Visibility::ShowAlways);
    EXPECT_EQ(native.titleBar(), Visibility::Hidden);
    EXPECT_EQ(native.cameraHousingOffset(), 0);
    EXPECT_TRUE(native.isNativeFullScreen());

    LayoutPreferences prefs;
    prefs.useLegacyFullScreen = true;
    const LayoutState legacy = layoutFor(prefs, WindowMode::FullScreen, 32);
    EXPECT_TRUE(legacy.isLegacyFullScreen());
    EXPECT_EQ(legacy.cameraHousingOffset(), 32);

    prefs.allowVideoToOverlapCameraHousing = true;
    EXPECT_EQ(layoutFor(prefs, WindowMode::FullScreen, 32).cameraHousingOffset(), 0);
}

TEST(LayoutStateTest, BuildGeometryUsesLayoutBars)
{
    LayoutPreferences prefs;
    prefs.bottomBarPlacement = PanelPlacement::OutsideViewport;
    prefs.oscPosition = OSCPosition::Bottom;
    const LayoutState layout = layoutFor(prefs);

    const WindowGeometry geometry = layout.buildGeometry(QRectF(100, 100, 640, 404), "main", ASPECT_16_9);
    EXPECT_EQ(geometry.fitOption(), ScreenFitOption::NoConstraints);
    EXPECT_EQ(geometry.topMarginHeight(), 0);
    EXPECT_EQ(geometry.outsideBars(), BoxQuad(0, 0, 44, 0));
    EXPECT_EQ(geometry.insideBars(), BoxQuad(28, 0, 0, 0));
    EXPECT_EQ(geometry.viewportSize(), QSizeF(640, 360));

    const LayoutState music = layoutFor(prefs, WindowMode::MusicMode);
    EXPECT_EQ(music.buildGeometry(QRectF(0, 0, 280, 230), "main", ASPECT_16_9).fitOption(),
              ScreenFitOption::KeepInVisibleScreen);
}

TEST(LayoutStateTest, PinToTopButton)
{
    const LayoutState windowed = layoutFor(LayoutPreferences());
    EXPECT_EQ(windowed.pinToTopButtonVisibility(false, false), Visibility::Hidden);
    EXPECT_EQ(windowed.pinToTopButtonVisibility(true, false), Visibility::ShowFadeableNonTopBar);
    EXPECT_EQ(windowed.pinToTopButtonVisibility(false, true), Visibility::ShowFadeableNonTopBar);

    LayoutPreferences prefs;
    prefs.topBarPlacement = PanelPlacement::OutsideViewport;
    EXPECT_EQ(layoutFor(prefs).pinToTopButtonVisibility(true, false), Visibility::ShowAlways);

    const LayoutState fullScreen = layoutFor(LayoutPreferences(), WindowMode::FullScreen);
    EXPECT_EQ(fullScreen.pinToTopButtonVisibility(true, true), Visibility::Hidden);
}

TEST(LayoutStateTest, RebuiltFromSameSpecIsEqual)
{
    EXPECT_EQ(layoutFor(LayoutPreferences()), layoutFor(LayoutPreferences()));
    LayoutPreferences prefs;
    prefs.oscPosition = OSCPosition::Top;
    EXPECT_NE(layoutFor(LayoutPreferences()), layoutFor(prefs));
}
