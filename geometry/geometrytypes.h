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

#ifndef GEOMETRYTYPES_H
#define GEOMETRYTYPES_H

#include <QString>

enum class WindowMode {
    Windowed = 1,
    FullScreen,
    MusicMode
};

/**
 * @brief Whether a bar is drawn over the video (inside) or pushes it inward (outside)
 */
enum class PanelPlacement {
    InsideViewport = 0,
    OutsideViewport
};

enum class OSCPosition {
    Floating = 0,
    Top,
    Bottom
};

/**
 * @brief Describes how a player window must fit inside its screen
 */
enum class ScreenFitOption {
    NoConstraints = 0,
    KeepInVisibleScreen,      ///< Constrain inside the screen's visible frame
    CenterInVisibleScreen,    ///< Constrain and center inside the visible frame
    LegacyFullScreen,         ///< Constrain inside the screen's full frame
    NativeFullScreen          ///< Constrain inside the frame without camera housing
};

inline bool isFullScreenFit(ScreenFitOption fit)
{
    return fit == ScreenFitOption::LegacyFullScreen || fit == ScreenFitOption::NativeFullScreen;
}

/**
 * @brief Whether a window using @p fit should be moved back inside its container
 * @param moveIntoVisibleScreenPref value of the "move window into visible screen on resize" setting
 */
inline bool shouldMoveWindowToKeepInContainer(ScreenFitOption fit, bool moveIntoVisibleScreenPref)
{
    switch (fit) {
    case ScreenFitOption::LegacyFullScreen:
    case ScreenFitOption::NativeFullScreen:
        return true;
    case ScreenFitOption::KeepInVisibleScreen:
    case ScreenFitOption::CenterInVisibleScreen:
        return moveIntoVisibleScreenPref;
    default:
        return false;
    }
}

inline QString toString(WindowMode mode)
{
    switch (mode) {
    case WindowMode::Windowed: return QStringLiteral("windowed");
    case WindowMode::FullScreen: return QStringLiteral("fullScreen");
    case WindowMode::MusicMode: return QStringLiteral("musicMode");
    }
    return QStringLiteral("unknown");
}

inline QString toString(ScreenFitOption fit)
{
    switch (fit) {
    case ScreenFitOption::NoConstraints: return QStringLiteral("noConstraints");
    case ScreenFitOption::KeepInVisibleScreen: return QStringLiteral("keepInVisibleScreen");
    case ScreenFitOption::CenterInVisibleScreen: return QStringLiteral("centerInVisibleScreen");
    case ScreenFitOption::LegacyFullScreen: return QStringLiteral("legacyFullScreen");
    case ScreenFitOption::NativeFullScreen: return QStringLiteral("nativeFullScreen");
    }
    return QStringLiteral("unknown");
}

inline QString toString(PanelPlacement placement)
{
    return placement == PanelPlacement::InsideViewport ? QStringLiteral("inside") : QStringLiteral("outside");
}

inline QString toString(OSCPosition position)
{
    switch (position) {
    case OSCPosition::Floating: return QStringLiteral("floating");
    case OSCPosition::Top: return QStringLiteral("top");
    case OSCPosition::Bottom: return QStringLiteral("bottom");
    }
    return QStringLiteral("unknown");
}

#endif // GEOMETRYTYPES_H
