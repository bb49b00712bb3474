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

#ifndef TRANSITIONPLANNER_H
#define TRANSITIONPLANNER_H

#include <QString>
#include <QSizeF>
#include <optional>

#include "layouttransition.h"
#include "layout/layoutpreferences.h"
#include "geometry/musicmodegeometry.h"

/**
 * @brief Viewport size the user asked for, kept so it can be restored later
 *
 * Recorded when opening an outside bar shrinks the window to fit the screen. Only
 * valid for the video aspect it was recorded with.
 */
struct IntendedViewportSize
{
    QSizeF size;
    qreal videoAspect = 0;
};

/**
 * @brief Inputs the planner reads besides the layouts themselves
 */
struct TransitionContext
{
    LayoutPreferences prefs;
    ScreenList screens;
    WindowGeometry windowedModeGeometry;
    MusicModeGeometry musicModeGeometry;
    qreal videoAspect = WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO;
    std::optional<IntendedViewportSize> intendedViewportSize;

    GeometryContext geometryContext() const { return prefs.geometryContext(screens); }
};

/**
 * @brief Builds LayoutTransitions
 *
 * Pure: reads only its inputs and returns a transition whose operations are data.
 * The coordinator owns the state and runs the operations.
 *
 * Operation order:
 *   PreTransition, ShowFadeableViews, FadeOutOldViews, ExitLegacyFullScreenUncoverCameraHousing
 *   (to native windowed), CloseOldPanels, SuspendVideo, UpdateHiddenViewsAndConstraints,
 *   ResumeVideo, MoveWindowForMusicMode, ExitLegacyFullScreenUncoverCameraHousing (to legacy
 *   windowed), OpenNewPanels, FadeInNewViews, EnterLegacyFullScreenCoverCameraHousing,
 *   PostTransition
 * Steps which do not apply to a transition are left out.
 */
class TransitionPlanner
{
public:
    explicit TransitionPlanner(const TransitionContext &context);

    /**
     * @brief Build the transition from @p inputLayout to the layout of @p outputSpec
     * @param isInitialLayout true when laying out a window as it opens. There is no
     *        middle geometry and no camera housing animation in that case.
     */
    LayoutTransition build(const QString &name, const LayoutState &inputLayout,
                           const LayoutSpec &outputSpec, bool isInitialLayout = false) const;

    LayoutStateOptions layoutOptions() const;

    /**
     * @brief Geometry of the window as it is in @p inputLayout
     *
     * An invalid windowed geometry is rebuilt from its window frame.
     */
    WindowGeometry buildInputGeometry(const LayoutState &inputLayout, const QString &transitionName) const;

    WindowGeometry buildOutputGeometry(const LayoutState &inputLayout, const WindowGeometry &inputGeometry,
                                       const LayoutState &outputLayout) const;

    /**
     * @brief Way-point geometry applied after the old panels close
     *
     * Each bar closes to the smaller of its input and output sizes, or to 0 when its
     * placement changes or its sidebar is closing, so no bar grows and then shrinks.
     * Nothing when toggling full screen or for the initial layout.
     */
    std::optional<WindowGeometry> buildMiddleGeometry(const LayoutTransition &transition) const;

private:
    ScreenInfo windowedModeScreen() const;
    QList<TransitionOperation> buildOperations(const LayoutTransition &transition) const;

    TransitionContext m_context;
};

#endif // TRANSITIONPLANNER_H
