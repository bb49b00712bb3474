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

#ifndef GLOBAL_H
#define GLOBAL_H

#include <QtGlobal>
#include <QSizeF>
#include "resources/version.h"

// Minimum allowed video size. Does not include any panels which are outside the video.
const qreal MIN_VIDEO_WIDTH = 285;
const qreal MIN_VIDEO_HEIGHT = 120;

// Size used when there is no video to derive an aspect from
const qreal WIDTH_WHEN_NO_VIDEO = 640;
const qreal HEIGHT_WHEN_NO_VIDEO = 360;

namespace SidebarConst {
    const qreal MIN_PLAYLIST_WIDTH = 240;
    const qreal MAX_PLAYLIST_WIDTH = 800;
    const qreal SETTINGS_WIDTH = 360;

    const qreal MIN_SPACE_BETWEEN_INSIDE_SIDEBARS = 220;

    // Sidebar tab buttons
    const qreal DEFAULT_DOWNSHIFT = 0;
    const qreal DEFAULT_TAB_HEIGHT = 48;
    const qreal MUSIC_MODE_TAB_HEIGHT = 32;
    const qreal MIN_TAB_HEIGHT = 16;
    const qreal MAX_TAB_HEIGHT = 70;
}

namespace MusicModeConst {
    const qreal OSC_HEIGHT = 72;
    const qreal MIN_PLAYLIST_HEIGHT = 138;
    const qreal MIN_WINDOW_WIDTH = 260;
    const qreal DEFAULT_WINDOW_WIDTH = 280;
    const qreal DEFAULT_PLAYLIST_HEIGHT = 300;
    const qreal DEFAULT_MAX_WINDOW_WIDTH = 2500;
}

namespace TitleBarConst {
    const qreal STANDARD_HEIGHT = 28;
    // Shares its space with a top OSC
    const qreal REDUCED_HEIGHT = 20;
    // Spacing between OSD and the top of the viewport
    const qreal OSD_OFFSET = 8;
}

const qreal MIN_OSC_BAR_HEIGHT = 24;
const qreal DEFAULT_OSC_BAR_HEIGHT = 44;

// Seconds
const qreal DEFAULT_ANIMATION_DURATION = 0.25;

#endif // GLOBAL_H
