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

#include "transitionplanner.h"
#include "geometry/rectutil.h"

TransitionPlanner::TransitionPlanner(const TransitionContext &context)
    : m_context(context)
{
}

ScreenInfo TransitionPlanner::windowedModeScreen() const
{
    // Full screen always uses the same screen as windowed mode
    return m_context.screens.screenOrDefault(m_context.windowedModeGeometry.screenID());
}

LayoutStateOptions TransitionPlanner::layoutOptions() const
{
    return LayoutStateOptions::fromPreferences(m_context.prefs, windowedModeScreen().cameraHousingHeight);
}

LayoutTransition TransitionPlanner::build(const QString &name, const LayoutState &inputLayout,
                                          const LayoutSpec &outputSpec, bool isInitialLayout) const
{
    const LayoutState outputLayout = LayoutState::fromSpec(outputSpec, layoutOptions());

    const WindowGeometry inputGeometry = buildInputGeometry(inputLayout, name);
    qCDebug(log_core_transition) << "[" << name << "] Built input geometry:" << inputGeometry;

    const WindowGeometry outputGeometry = buildOutputGeometry(inputLayout, inputGeometry, outputLayout);
    qCDebug(log_core_transition) << "[" << name << "] Built output geometry:" << outputGeometry;

    LayoutTransition transition(name, inputLayout, inputGeometry, outputLayout, outputGeometry, isInitialLayout);
    if (!isInitialLayout) {
        transition.setMiddleGeometry(buildMiddleGeometry(transition));
        if (transition.middleGeometry()) {
            qCDebug(log_core_transition) << "[" << name << "] Built middle geometry:" << *transition.middleGeometry();
        }
    }

    transition.setOperations(buildOperations(transition));
    qCDebug(log_core_transition).noquote() << transition.toString();
    return transition;
}

WindowGeometry TransitionPlanner::buildInputGeometry(const LayoutState &inputLayout, const QString &transitionName) const
{
    const GeometryContext geometryContext = m_context.geometryContext();

    switch (inputLayout.mode()) {
    case WindowMode::FullScreen:
        return inputLayout.buildFullScreenGeometry(windowedModeScreen(), m_context.videoAspect);
    case WindowMode::MusicMode:
        // Correct any size problems in the restored geometry
        return m_context.musicModeGeometry.refit(geometryContext).toWindowGeometry();
    case WindowMode::Windowed:
        break;
    }

    const WindowGeometry &windowed = m_context.windowedModeGeometry;
    if (windowed.isValid()) {
        return windowed;
    }
    qCWarning(log_core_transition) << "[" << transitionName << "] Windowed geometry is invalid, rebuilding it from its frame:"
                                   << windowed;
    return inputLayout.buildGeometry(windowed.windowFrame(), windowed.screenID(), windowed.videoAspect())
        .refit(geometryContext, ScreenFitOption::KeepInVisibleScreen);
}

WindowGeometry TransitionPlanner::buildOutputGeometry(const LayoutState &inputLayout, const WindowGeometry &inputGeometry,
                                                      const LayoutState &outputLayout) const
{
    const GeometryContext geometryContext = m_context.geometryContext();

    switch (outputLayout.mode()) {
    case WindowMode::MusicMode:
        // The video aspect may have changed while not in music mode
        return m_context.musicModeGeometry.withVideoAspect(m_context.videoAspect).refit(geometryContext).toWindowGeometry();
    case WindowMode::FullScreen: {
        const ScreenInfo screen = m_context.screens.screenOrDefault(inputGeometry.screenID());
        return outputLayout.buildFullScreenGeometry(screen, m_context.videoAspect);
    }
    case WindowMode::Windowed:
        break;
    }

    WindowGeometry windowed = m_context.windowedModeGeometry;
    if (!windowed.isValid()) {
        windowed = inputLayout.isWindowed() ? inputGeometry
                                            : outputLayout.buildGeometry(windowed.windowFrame(), windowed.screenID(),
                                                                         windowed.videoAspect());
    }

    const WindowGeometry outputGeometry = windowed.withResizedBars(geometryContext,
                                                                   BarChanges::from(outputLayout.outsideBars()),
                                                                   BarChanges::from(outputLayout.insideBars()),
                                                                   std::nullopt, inputGeometry.videoAspect());

    const qreal deltaOutsideWidth = outputGeometry.outsideBars().totalWidth() - inputGeometry.outsideBars().totalWidth();
    const qreal deltaOutsideHeight = outputGeometry.outsideBars().totalHeight() - inputGeometry.outsideBars().totalHeight();
    // Shrinking width, or keeping width but shrinking height
    if (deltaOutsideWidth < 0 || (deltaOutsideWidth == 0 && deltaOutsideHeight < 0)) {
        // An outside bar which made the window shrink to fit on screen is closing: restore the size from before
        const std::optional<IntendedViewportSize> &intended = m_context.intendedViewportSize;
        if (m_context.prefs.isViewportLockedToVideo() && intended
            && RectUtil::isSameAspect(intended->videoAspect, inputGeometry.videoAspect())
            && RectUtil::isSameAspect(windowed.videoAspect(), inputGeometry.videoAspect())) {
            qCDebug(log_core_transition) << "Instead of shrinking window by" << deltaOutsideWidth << "W and"
                                         << deltaOutsideHeight << "H, restoring intended viewport size"
                                         << RectUtil::toString(intended->size);
            return outputGeometry.scaleViewport(geometryContext, intended->size);
        }
    }
    return outputGeometry;
}

std::optional<WindowGeometry> TransitionPlanner::buildMiddleGeometry(const LayoutTransition &transition) const
{
    if (transition.isInitialLayout() || transition.isTogglingFullScreen()) {
        return std::nullopt;
    }

    const GeometryContext geometryContext = m_context.geometryContext();
    const WindowGeometry &inputGeometry = transition.inputGeometry();
    const WindowGeometry &outputGeometry = transition.outputGeometry();
    const LayoutState &inputLayout = transition.inputLayout();
    const LayoutState &outputLayout = transition.outputLayout();

    if (transition.isEnteringMusicMode()) {
        return inputGeometry.withResizedBars(geometryContext, BarChanges::from(BoxQuad()), BarChanges::from(BoxQuad()));
    }
    if (transition.isExitingMusicMode()) {
        // Only the bottom bar needs to close. No need to constrain in screen.
        BarChanges outsideBars;
        outsideBars.bottom = 0;
        return inputGeometry.withResizedOutsideBars(outsideBars);
    }

    // Top
    qreal topBarHeight;
    if (transition.isTopBarPlacementChanging()) {
        // Close completely. Reopens later if needed.
        topBarHeight = 0;
    } else {
        topBarHeight = qMin(inputLayout.topBarHeight(), outputLayout.topBarHeight());
    }
    const bool topIsInside = outputLayout.topBarPlacement() == PanelPlacement::InsideViewport;
    const qreal insideTopBarHeight = topIsInside ? topBarHeight : 0;
    const qreal outsideTopBarHeight = topIsInside ? 0 : topBarHeight;

    // Bottom
    qreal insideBottomBarHeight;
    qreal outsideBottomBarHeight;
    if (transition.isBottomBarPlacementChanging()) {
        insideBottomBarHeight = 0;
        outsideBottomBarHeight = 0;
    } else if (outputGeometry.outsideBars().bottom < inputGeometry.outsideBars().bottom) {
        insideBottomBarHeight = 0;
        outsideBottomBarHeight = outputGeometry.outsideBars().bottom;
    } else if (outputGeometry.insideBars().bottom < inputGeometry.insideBars().bottom) {
        insideBottomBarHeight = outputGeometry.insideBars().bottom;
        outsideBottomBarHeight = 0;
    } else {
        insideBottomBarHeight = inputGeometry.insideBars().bottom;
        outsideBottomBarHeight = inputGeometry.outsideBars().bottom;
    }

    // Leading
    qreal insideLeadingBarWidth = 0;
    qreal outsideLeadingBarWidth = 0;
    if (!transition.isHidingLeadingSidebar()) {
        // Narrowing sidebars shrink in this step. Widening ones grow in the next.
        insideLeadingBarWidth = qMin(inputGeometry.insideBars().leading, outputGeometry.insideBars().leading);
        outsideLeadingBarWidth = qMin(inputGeometry.outsideBars().leading, outputGeometry.outsideBars().leading);
    }

    // Trailing
    qreal insideTrailingBarWidth = 0;
    qreal outsideTrailingBarWidth = 0;
    if (!transition.isHidingTrailingSidebar()) {
        insideTrailingBarWidth = qMin(inputGeometry.insideBars().trailing, outputGeometry.insideBars().trailing);
        outsideTrailingBarWidth = qMin(inputGeometry.outsideBars().trailing, outputGeometry.outsideBars().trailing);
    }

    const BoxQuad outsideBars(outsideTopBarHeight, outsideTrailingBarWidth, outsideBottomBarHeight, outsideLeadingBarWidth);
    const BoxQuad insideBars(insideTopBarHeight, insideTrailingBarWidth, insideBottomBarHeight, insideLeadingBarWidth);

    if (outputLayout.isFullScreen()) {
        const ScreenInfo screen = m_context.screens.screenOrDefault(inputGeometry.screenID());
        return WindowGeometry::forFullScreen(screen, outputLayout.isLegacyFullScreen(), WindowMode::FullScreen,
                                             outsideBars, insideBars, m_context.videoAspect,
                                             m_context.prefs.allowVideoToOverlapCameraHousing);
    }
    return outputGeometry.withResizedBars(geometryContext, BarChanges::from(outsideBars), BarChanges::from(insideBars));
}

QList<TransitionOperation> TransitionPlanner::buildOperations(const LayoutTransition &transition) const
{
    QList<TransitionOperation> ops;

    TimingCurve panelTiming = TimingCurve::Linear;
    if (transition.isTogglingFullScreen()) {
        panelTiming = TimingCurve::EaseInEaseOut;
    } else if (transition.isTogglingVisibilityOfAnySidebar()) {
        panelTiming = TimingCurve::EaseIn;
    }

    // Durations

    const qreal defaultDuration = m_context.prefs.animationDuration;
    qreal startingDuration = defaultDuration;
    if (transition.isTogglingFullScreen()) {
        startingDuration = 0;
    } else if (transition.isEnteringMusicMode()) {
        startingDuration = defaultDuration * 0.3;
    }

    qreal showFadeableViewsDuration = startingDuration;
    qreal fadeOutOldViewsDuration = startingDuration;
    if (transition.isExitingMusicMode()) {
        showFadeableViewsDuration = 0;
        fadeOutOldViewsDuration = 0;
    }

    const qreal endingDuration = defaultDuration;
    const qreal closeOldPanelsDuration = startingDuration;

    const ScreenInfo screen = windowedModeScreen();
    const bool useExtraStepForExitingLegacyFullScreen = transition.isExitingLegacyFullScreen()
        && screen.hasCameraHousing() && !transition.isInitialLayout() && endingDuration > 0;
    const bool useExtraStepForEnteringLegacyFullScreen = transition.isEnteringLegacyFullScreen()
        && screen.hasCameraHousing() && !transition.isInitialLayout() && endingDuration > 0;
    qreal openNewPanelsDuration = endingDuration;
    if (useExtraStepForEnteringLegacyFullScreen) {
        openNewPanelsDuration *= 0.8;
    }

    // Legacy full screen window showing the camera housing again
    GeometryChanges uncoverChanges;
    uncoverChanges.windowFrame = screen.frameWithoutCameraHousing();
    uncoverChanges.topMarginHeight = 0;
    const bool outputIsLegacyStyle = transition.outputLayout().spec().isLegacyStyle();

    // Starting steps

    ops.append(TransitionOperation(OperationKind::PreTransition, 0));
    ops.append(TransitionOperation(OperationKind::ShowFadeableViews, showFadeableViewsDuration));

    if (transition.needsFadeOutOldViews()) {
        ops.append(TransitionOperation(OperationKind::FadeOutOldViews, fadeOutOldViewsDuration));
    }

    if (useExtraStepForExitingLegacyFullScreen && !outputIsLegacyStyle) {
        ops.append(TransitionOperation(OperationKind::ExitLegacyFullScreenUncoverCameraHousing, endingDuration * 0.2,
                                       TimingCurve::EaseIn, transition.inputGeometry().withChanges(uncoverChanges)));
    }

    if (transition.needsCloseOldPanels()) {
        ops.append(TransitionOperation(OperationKind::CloseOldPanels, closeOldPanelsDuration, panelTiming,
                                       transition.middleGeometry()));
    }

    // Middle steps. Restyling can flash the video, so it is paused around the swap.

    if (transition.isTogglingLegacyStyle()) {
        ops.append(TransitionOperation(OperationKind::SuspendVideo, 0));
    }
    ops.append(TransitionOperation(OperationKind::UpdateHiddenViewsAndConstraints, 0));
    if (transition.isTogglingLegacyStyle()) {
        ops.append(TransitionOperation(OperationKind::ResumeVideo, 0));
    }

    if (transition.isEnteringMusicMode() && !transition.isInitialLayout() && !transition.isTogglingFullScreen()) {
        ops.append(TransitionOperation(OperationKind::MoveWindowForMusicMode, defaultDuration,
                                       TimingCurve::EaseInEaseOut, transition.outputGeometry()));
    }

    // Ending steps

    if (useExtraStepForExitingLegacyFullScreen && outputIsLegacyStyle) {
        ops.append(TransitionOperation(OperationKind::ExitLegacyFullScreenUncoverCameraHousing, endingDuration * 0.2,
                                       TimingCurve::EaseIn, transition.inputGeometry().withChanges(uncoverChanges)));
    }

    WindowGeometry openGeometry = transition.outputGeometry();
    if (useExtraStepForEnteringLegacyFullScreen) {
        // Cover the camera housing in a separate step
        openGeometry = openGeometry.withChanges(uncoverChanges);
    }
    ops.append(TransitionOperation(OperationKind::OpenNewPanels, openNewPanelsDuration, panelTiming, openGeometry));

    if (!transition.isTogglingFullScreen() && transition.needsFadeInNewViews()) {
        ops.append(TransitionOperation(OperationKind::FadeInNewViews, endingDuration, panelTiming));
    }

    if (useExtraStepForEnteringLegacyFullScreen) {
        GeometryChanges coverChanges;
        coverChanges.windowFrame = screen.frame;
        coverChanges.topMarginHeight = m_context.prefs.allowVideoToOverlapCameraHousing ? 0 : screen.cameraHousingHeight;
        ops.append(TransitionOperation(OperationKind::EnterLegacyFullScreenCoverCameraHousing, endingDuration * 0.2,
                                       TimingCurve::EaseIn, transition.outputGeometry().withChanges(coverChanges)));
    }

    ops.append(TransitionOperation(OperationKind::PostTransition, 0));

    // Nothing to animate: apply everything at once
    if (!transition.isInitialLayout() && transition.inputLayout().spec() == transition.outputLayout().spec()) {
        for (TransitionOperation &op : ops) {
            op.duration = 0;
        }
    }
    return ops;
}
