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

#ifndef PLAYERWINDOWHOST_H
#define PLAYERWINDOWHOST_H

#include "geometry/screeninfo.h"
#include "geometry/windowgeometry.h"
#include "layout/layoutstate.h"
#include "transition/transitionoperation.h"

/**
 * @brief The window side of the layout engine
 *
 * WindowLayoutCoordinator decides what to show and where; an implementation of this
 * interface does the drawing. All geometry is in model coordinates (bottom-left
 * origin). Every call comes from the GUI thread.
 */
class PlayerWindowHost
{
public:
    virtual ~PlayerWindowHost() = default;

    /// Screens the window can be placed on
    virtual ScreenList screens() const = 0;

    /**
     * @brief Move and resize the window and its bars to @p geometry
     * @param duration seconds. 0 applies the frame immediately.
     */
    virtual void setWindowGeometry(const WindowGeometry &geometry, qreal duration, TimingCurve timing) = 0;

    /// Show the views of @p layout which normally fade in and out, so they can fade out smoothly
    virtual void showFadeableViews(const LayoutState &layout, qreal duration) = 0;

    /// Fade out the views shown in @p oldLayout which are hidden or restyled in @p newLayout
    virtual void fadeOutOldViews(const LayoutState &oldLayout, const LayoutState &newLayout, qreal duration) = 0;

    /// Show or hide each view without animation to match @p layout
    virtual void updateHiddenViews(const LayoutState &layout) = 0;

    virtual void fadeInNewViews(const LayoutState &layout, qreal duration) = 0;

    /**
     * @brief Switch window decoration for @p layout
     *
     * Covers the title bar style and entering or leaving full screen.
     */
    virtual void applyWindowStyle(const LayoutState &layout) = 0;

    /// Stop or restart live video updates around a window style change
    virtual void setVideoUpdatesSuspended(bool suspended) = 0;
};

#endif // PLAYERWINDOWHOST_H
