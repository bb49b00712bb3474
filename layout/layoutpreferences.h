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

#ifndef LAYOUTPREFERENCES_H
#define LAYOUTPREFERENCES_H

#include <QString>

#include "global.h"
#include "geometry/geometrytypes.h"
#include "geometry/windowgeometry.h"
#include "sidebar.h"

/// When to resize the window after a new video size becomes known
enum class ResizeWindowTiming {
    Always = 0,
    OnlyWhenOpen,
    Never
};

enum class ResizeWindowScheme {
    SimpleVideoSizeMultiple = 0,
    MpvGeometry     ///< Apply the external geometry directive
};

enum class ResizeWindowOption {
    FitScreen = 0,
    VideoSize05,
    VideoSize10,
    VideoSize15,
    VideoSize20
};

/**
 * @brief Multiple of the video size for @p option, or -1 for FitScreen
 */
inline qreal resizeWindowRatio(ResizeWindowOption option)
{
    switch (option) {
    case ResizeWindowOption::VideoSize05: return 0.5;
    case ResizeWindowOption::VideoSize10: return 1.0;
    case ResizeWindowOption::VideoSize15: return 1.5;
    case ResizeWindowOption::VideoSize20: return 2.0;
    case ResizeWindowOption::FitScreen: break;
    }
    return -1;
}

/**
 * @brief Snapshot of the app-wide settings which shape a player window's layout
 *
 * Loaded by GlobalSetting::layoutPreferences(). The layout code only reads this
 * plain struct, so it never touches QSettings directly.
 */
struct LayoutPreferences
{
    // Bars
    PanelPlacement topBarPlacement = PanelPlacement::InsideViewport;
    PanelPlacement bottomBarPlacement = PanelPlacement::InsideViewport;
    PanelPlacement leadingSidebarPlacement = PanelPlacement::InsideViewport;
    PanelPlacement trailingSidebarPlacement = PanelPlacement::InsideViewport;
    SidebarTabGroups leadingSidebarTabGroups = SidebarTabGroup::Settings;
    SidebarTabGroups trailingSidebarTabGroups = SidebarTabGroup::Playlist;
    qreal playlistWidth = 270;

    // On-screen controls
    bool enableOSC = true;
    OSCPosition oscPosition = OSCPosition::Floating;
    qreal oscBarHeight = DEFAULT_OSC_BAR_HEIGHT;

    // Window style
    bool useLegacyWindowedMode = false;
    bool useLegacyFullScreen = false;
    bool showLeadingSidebarToggleButton = true;
    bool showTrailingSidebarToggleButton = true;
    bool alwaysShowOnTopIcon = false;
    bool fullScreenWhenOpen = false;

    // Sizing
    bool lockViewportToVideoSize = true;
    bool allowEmptySpaceAroundVideo = false;
    bool moveWindowIntoVisibleScreenOnResize = true;
    bool allowVideoToOverlapCameraHousing = false;
    ResizeWindowTiming resizeWindowTiming = ResizeWindowTiming::OnlyWhenOpen;
    ResizeWindowScheme resizeWindowScheme = ResizeWindowScheme::SimpleVideoSizeMultiple;
    ResizeWindowOption resizeWindowOption = ResizeWindowOption::VideoSize10;
    QString geometryDirective;
    qreal musicModeMaxWindowWidth = MusicModeConst::DEFAULT_MAX_WINDOW_WIDTH;

    /// Seconds
    qreal animationDuration = DEFAULT_ANIMATION_DURATION;

    /// Empty space around the video wins over the viewport lock
    bool isViewportLockedToVideo() const {
        return lockViewportToVideoSize && !allowEmptySpaceAroundVideo;
    }

    GeometryContext geometryContext(const ScreenList &screens) const {
        GeometryContext context;
        context.screens = screens;
        context.lockViewportToVideoSize = isViewportLockedToVideo();
        context.moveWindowIntoVisibleScreen = moveWindowIntoVisibleScreenOnResize;
        context.allowVideoToOverlapCameraHousing = allowVideoToOverlapCameraHousing;
        context.musicModeMaxWindowWidth = musicModeMaxWindowWidth;
        return context;
    }
};

#endif // LAYOUTPREFERENCES_H
