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

#include "windowlayoutcoordinator.h"
#include "ui/playerwindowhost.h"
#include "geometry/geometrydef.h"
#include "geometry/rectutil.h"
#include "global.h"
#include <QDebug>
#include <memory>
#include <cmath>

Q_LOGGING_CATEGORY(log_ui_coordinator, "lbx.ui.coordinator")

WindowLayoutCoordinator::WindowLayoutCoordinator(PlayerWindowHost *host,
                                                 const LayoutPreferences &prefs,
                                                 QObject *parent)
    : QObject(parent)
    , m_host(host)
    , m_animationQueue(new AnimationQueue(this))
    , m_prefs(prefs)
    , m_videoAspect(WIDTH_WHEN_NO_VIDEO / HEIGHT_WHEN_NO_VIDEO)
{
    m_windowedModeGeometry = defaultWindowedGeometry();
    m_musicModeGeometry = MusicModeGeometry::defaultGeometry(m_host->screens().screenOrDefault(QString()), m_videoAspect);
    qCDebug(log_ui_coordinator) << "WindowLayoutCoordinator created";
}

WindowLayoutCoordinator::~WindowLayoutCoordinator()
{
    qCDebug(log_ui_coordinator) << "WindowLayoutCoordinator destroyed";
}

GeometryContext WindowLayoutCoordinator::geometryContext() const
{
    return m_prefs.geometryContext(m_host->screens());
}

TransitionContext WindowLayoutCoordinator::transitionContext() const
{
    TransitionContext context;
    context.prefs = m_prefs;
    context.screens = m_host->screens();
    context.windowedModeGeometry = m_windowedModeGeometry;
    context.musicModeGeometry = m_musicModeGeometry;
    context.videoAspect = m_videoAspect;
    context.intendedViewportSize = m_intendedViewportSize;
    return context;
}

ScreenInfo WindowLayoutCoordinator::windowedModeScreen() const
{
    return m_host->screens().screenOrDefault(m_windowedModeGeometry.screenID());
}

WindowGeometry WindowLayoutCoordinator::defaultWindowedGeometry() const
{
    const ScreenInfo screen = m_host->screens().screenOrDefault(QString());
    const QSizeF videoSize(WIDTH_WHEN_NO_VIDEO, HEIGHT_WHEN_NO_VIDEO);
    const QRectF frame = RectUtil::centeredRect(videoSize, screen.visibleFrame);

    ScaleRequest request;
    request.fitOption = ScreenFitOption::CenterInVisibleScreen;
    return m_currentLayout.buildGeometry(frame, screen.id, m_videoAspect).scaleVideo(geometryContext(), videoSize, request);
}

WindowGeometry WindowLayoutCoordinator::currentGeometry() const
{
    switch (m_currentLayout.mode()) {
    case WindowMode::FullScreen:
        return m_currentLayout.buildFullScreenGeometry(windowedModeScreen(), m_videoAspect);
    case WindowMode::MusicMode:
        return m_musicModeGeometry.toWindowGeometry();
    case WindowMode::Windowed:
        break;
    }
    return m_windowedModeGeometry;
}

// Transitions

void WindowLayoutCoordinator::setInitialLayout(const PlayerSaveState &priorState)
{
    LayoutSpec initialLayoutSpec;
    bool isRestoringFromPrevLaunch = false;
    bool needsNativeFullScreen = false;

    if (priorState.layoutSpec) {
        qCDebug(log_ui_coordinator) << "Transitioning to initial layout from prior window state";
        const LayoutSpec &priorLayoutSpec = *priorState.layoutSpec;
        isRestoringFromPrevLaunch = true;
        m_isRestoring = true;
        m_priorState = priorState;

        if (priorState.windowedModeGeometry) {
            m_windowedModeGeometry = *priorState.windowedModeGeometry;
            if (!priorLayoutSpec.isMusicMode()) {
                m_videoAspect = m_windowedModeGeometry.videoAspect();
            }
        } else {
            qCWarning(log_ui_coordinator) << "No saved windowed geometry, keeping the current one";
        }

        if (priorState.musicModeGeometry) {
            m_musicModeGeometry = *priorState.musicModeGeometry;
            if (priorLayoutSpec.isMusicMode()) {
                m_videoAspect = m_musicModeGeometry.videoAspect();
            }
        } else {
            qCWarning(log_ui_coordinator) << "No saved music mode geometry, keeping the current one";
        }

        if (priorLayoutSpec.isNativeFullScreen()) {
            // Open windowed, then enter native full screen from there
            LayoutSpecChanges changes;
            changes.mode = WindowMode::Windowed;
            initialLayoutSpec = priorLayoutSpec.withChanges(changes);
            needsNativeFullScreen = true;
        } else {
            initialLayoutSpec = priorLayoutSpec;
        }
    } else {
        qCDebug(log_ui_coordinator) << "Transitioning to initial layout from settings";
        WindowMode mode = m_currentLayout.mode();
        if (m_prefs.fullScreenWhenOpen) {
            qCDebug(log_ui_coordinator) << "Changing to full screen because fullScreenWhenOpen is set";
            mode = WindowMode::FullScreen;
        } else if (m_currentLayout.isFullScreen()) {
            mode = WindowMode::Windowed;
        }
        initialLayoutSpec = LayoutSpec::fromPreferences(m_prefs, m_currentLayout.spec(), mode);
    }

    const QString transitionName = isRestoringFromPrevLaunch ? QStringLiteral("RestoreInitialLayout")
                                                             : QStringLiteral("SetInitialLayout");
    const LayoutTransition initialTransition = TransitionPlanner(transitionContext())
        .build(transitionName, m_currentLayout, initialLayoutSpec, true);

    // The window is not shown yet, so everything is applied at once
    for (const TransitionOperation &operation : initialTransition.operations()) {
        executeOperation(initialTransition, operation, 0);
    }
    qCDebug(log_ui_coordinator) << "Done with transition to initial layout";

    if (needsNativeFullScreen) {
        enqueueTransition(QStringLiteral("RestoreNativeFullScreen"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
            LayoutSpecChanges changes;
            changes.mode = WindowMode::FullScreen;
            changes.isLegacyStyle = false;
            return current.spec().withChanges(changes);
        }, true);
        return;
    }

    if (!isRestoringFromPrevLaunch) {
        return;
    }

    // Saved layout may no longer agree with the settings
    const LayoutSpec prefsSpec = LayoutSpec::fromPreferences(m_prefs, m_currentLayout.spec());
    if (initialLayoutSpec.hasSamePrefsValues(prefsSpec)) {
        qCDebug(log_ui_coordinator) << "Saved layout is consistent with settings";
    } else {
        qCWarning(log_ui_coordinator) << "Saved layout does not match settings. Will apply a corrected layout";
        qCDebug(log_ui_coordinator) << "SavedSpec:" << m_currentLayout.spec() << "PrefsSpec:" << prefsSpec;
        transitionTo(prefsSpec, QStringLiteral("FixInvalidInitialLayout"));
    }
}

void WindowLayoutCoordinator::transitionTo(const LayoutSpec &spec, const QString &name)
{
    enqueueTransition(name, [spec](const LayoutState &) -> std::optional<LayoutSpec> {
        return spec;
    });
}

void WindowLayoutCoordinator::enqueueTransition(const QString &name, const SpecBuilder &buildSpec, bool instant)
{
    m_animationQueue->addTask(AnimationTask::instant([this, name, buildSpec, instant]() {
        const std::optional<LayoutSpec> outputSpec = buildSpec(m_currentLayout);
        if (!outputSpec) {
            qCDebug(log_ui_coordinator) << "Skipping transition" << name;
            return;
        }
        const LayoutTransition transition = TransitionPlanner(transitionContext()).build(name, m_currentLayout, *outputSpec);
        m_animationQueue->addTasksNext(buildTasks(transition, instant));
    }));
}

QList<AnimationTask> WindowLayoutCoordinator::buildTasks(const LayoutTransition &transition, bool instant)
{
    const auto shared = std::make_shared<const LayoutTransition>(transition);
    QList<AnimationTask> tasks;
    for (const TransitionOperation &operation : transition.operations()) {
        const qreal duration = instant ? 0 : operation.duration;
        tasks.append(AnimationTask(duration, operation.timing, [this, shared, operation, duration]() {
            executeOperation(*shared, operation, duration * m_animationQueue->durationScale());
        }));
    }
    return tasks;
}

void WindowLayoutCoordinator::executeOperation(const LayoutTransition &transition,
                                               const TransitionOperation &operation, qreal duration)
{
    qCDebug(log_ui_coordinator) << "[" << transition.name() << "]" << operation;

    switch (operation.kind) {
    case OperationKind::PreTransition:
        break;
    case OperationKind::ShowFadeableViews:
        m_host->showFadeableViews(transition.inputLayout(), duration);
        break;
    case OperationKind::FadeOutOldViews:
        m_host->fadeOutOldViews(transition.inputLayout(), transition.outputLayout(), duration);
        break;
    case OperationKind::SuspendVideo:
        m_host->setVideoUpdatesSuspended(true);
        break;
    case OperationKind::UpdateHiddenViewsAndConstraints:
        m_host->applyWindowStyle(transition.outputLayout());
        m_host->updateHiddenViews(transition.outputLayout());
        break;
    case OperationKind::ResumeVideo:
        m_host->setVideoUpdatesSuspended(false);
        break;
    case OperationKind::ExitLegacyFullScreenUncoverCameraHousing:
    case OperationKind::CloseOldPanels:
    case OperationKind::MoveWindowForMusicMode:
    case OperationKind::EnterLegacyFullScreenCoverCameraHousing:
        if (operation.geometry) {
            m_host->setWindowGeometry(*operation.geometry, duration, operation.timing);
        }
        break;
    case OperationKind::OpenNewPanels:
        if (operation.geometry) {
            m_host->setWindowGeometry(*operation.geometry, duration, operation.timing);
            emit geometryApplied(operation.geometry->windowFrame());
        }
        break;
    case OperationKind::FadeInNewViews:
        m_host->fadeInNewViews(transition.outputLayout(), duration);
        break;
    case OperationKind::PostTransition:
        finishTransition(transition);
        break;
    }
}

void WindowLayoutCoordinator::finishTransition(const LayoutTransition &transition)
{
    const bool wasFullScreen = m_currentLayout.isFullScreen();
    m_currentLayout = transition.outputLayout();

    switch (m_currentLayout.mode()) {
    case WindowMode::Windowed:
        m_windowedModeGeometry = transition.outputGeometry();
        break;
    case WindowMode::MusicMode:
        m_musicModeGeometry = m_musicModeGeometry.withVideoAspect(m_videoAspect).refit(geometryContext());
        break;
    case WindowMode::FullScreen:
        // Windowed geometry is kept for when full screen exits
        break;
    }

    qCDebug(log_ui_coordinator) << "Done with transition" << transition.name() << "- now:" << m_currentLayout.spec();
    if (wasFullScreen != m_currentLayout.isFullScreen()) {
        emit fullscreenChanged(m_currentLayout.isFullScreen());
    }
    emit layoutChanged(m_currentLayout);
    emit transitionFinished(transition.name());
}

void WindowLayoutCoordinator::enterFullScreen()
{
    enqueueTransition(QStringLiteral("EnterFullScreen"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (current.isFullScreen()) {
            return std::nullopt;
        }
        if (!current.canToggleFullScreen()) {
            qCWarning(log_ui_coordinator) << "Cannot enter full screen from" << toString(current.mode());
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        changes.mode = WindowMode::FullScreen;
        changes.isLegacyStyle = m_prefs.useLegacyFullScreen;
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::exitFullScreen()
{
    enqueueTransition(QStringLiteral("ExitFullScreen"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.isFullScreen()) {
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        changes.mode = WindowMode::Windowed;
        changes.isLegacyStyle = m_prefs.useLegacyWindowedMode;
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::toggleFullScreen()
{
    enqueueTransition(QStringLiteral("ToggleFullScreen"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.canToggleFullScreen()) {
            qCWarning(log_ui_coordinator) << "Cannot toggle full screen from" << toString(current.mode());
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        if (current.isFullScreen()) {
            changes.mode = WindowMode::Windowed;
            changes.isLegacyStyle = m_prefs.useLegacyWindowedMode;
        } else {
            changes.mode = WindowMode::FullScreen;
            changes.isLegacyStyle = m_prefs.useLegacyFullScreen;
        }
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::enterMusicMode()
{
    enqueueTransition(QStringLiteral("EnterMusicMode"), [](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (current.isMusicMode()) {
            return std::nullopt;
        }
        if (current.isFullScreen()) {
            qCWarning(log_ui_coordinator) << "Exit full screen before entering music mode";
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        changes.mode = WindowMode::MusicMode;
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::exitMusicMode()
{
    enqueueTransition(QStringLiteral("ExitMusicMode"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.isMusicMode()) {
            return std::nullopt;
        }
        return LayoutSpec::fromPreferences(m_prefs, current.spec(), WindowMode::Windowed);
    });
}

void WindowLayoutCoordinator::showSidebar(const SidebarTab &tab)
{
    enqueueTransition(QStringLiteral("ShowSidebar"), [this, tab](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.canShowSidebars()) {
            qCWarning(log_ui_coordinator) << "Cannot show sidebars in" << toString(current.mode());
            return std::nullopt;
        }

        SidebarLocation location;
        if (current.leadingSidebar().tabGroups().testFlag(tab.group())) {
            location = SidebarLocation::Leading;
        } else if (current.trailingSidebar().tabGroups().testFlag(tab.group())) {
            location = SidebarLocation::Trailing;
        } else {
            qCWarning(log_ui_coordinator) << "No sidebar is configured to show tab" << tab.name();
            return std::nullopt;
        }

        LayoutSpecChanges changes;
        if (location == SidebarLocation::Leading) {
            changes.leadingSidebar = current.leadingSidebar().withVisibleTab(tab);
        } else {
            changes.trailingSidebar = current.trailingSidebar().withVisibleTab(tab);
        }
        const LayoutSpec spec = current.spec().withChanges(changes);

        // Make room between the inside sidebars by closing the other one
        const qreal viewportWidth = currentGeometry().viewportSize().width();
        LayoutSpecChanges hideChanges;
        for (SidebarLocation toHide : spec.sidebarsToHide(viewportWidth)) {
            if (toHide == location) {
                continue;
            }
            qCDebug(log_ui_coordinator) << "Closing" << toString(toHide) << "sidebar to make room";
            if (toHide == SidebarLocation::Leading) {
                hideChanges.leadingSidebar = spec.leadingSidebar().hidden();
            } else {
                hideChanges.trailingSidebar = spec.trailingSidebar().hidden();
            }
        }
        return spec.withChanges(hideChanges);
    });
}

void WindowLayoutCoordinator::hideSidebar(SidebarLocation location)
{
    enqueueTransition(QStringLiteral("HideSidebar"), [location](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.sidebar(location).isVisible()) {
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        if (location == SidebarLocation::Leading) {
            changes.leadingSidebar = current.leadingSidebar().hidden();
        } else {
            changes.trailingSidebar = current.trailingSidebar().hidden();
        }
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::hideSidebars()
{
    enqueueTransition(QStringLiteral("HideSidebars"), [](const LayoutState &current) -> std::optional<LayoutSpec> {
        if (!current.leadingSidebar().isVisible() && !current.trailingSidebar().isVisible()) {
            return std::nullopt;
        }
        LayoutSpecChanges changes;
        changes.leadingSidebar = current.leadingSidebar().hidden();
        changes.trailingSidebar = current.trailingSidebar().hidden();
        return current.spec().withChanges(changes);
    });
}

void WindowLayoutCoordinator::applyPreferences(const LayoutPreferences &prefs)
{
    m_prefs = prefs;
    enqueueTransition(QStringLiteral("ApplyPreferences"), [this](const LayoutState &current) -> std::optional<LayoutSpec> {
        const LayoutSpec spec = LayoutSpec::fromPreferences(m_prefs, current.spec());
        if (spec == current.spec()) {
            qCDebug(log_ui_coordinator) << "Layout is unchanged by new settings";
        }
        return spec;
    });
}

// Resizing

WindowGeometry WindowLayoutCoordinator::resizeWindow(const QSizeF &requestedSize, bool inLiveResize)
{
    const GeometryContext context = geometryContext();

    if (m_currentLayout.isFullScreen()) {
        qCWarning(log_ui_coordinator) << "Resize request ignored in full screen";
        return currentGeometry();
    }
    if (m_currentLayout.isMusicMode()) {
        // Keep the top edge where it is
        const QRectF frame = m_musicModeGeometry.windowFrame();
        const QRectF requestedFrame(frame.x(), RectUtil::maxY(frame) - requestedSize.height(),
                                    requestedSize.width(), requestedSize.height());
        return m_musicModeGeometry.withWindowFrame(requestedFrame).refit(context).toWindowGeometry();
    }

    const WindowGeometry &currentGeometry = m_windowedModeGeometry;

    if (m_denyNextWindowResize) {
        qCDebug(log_ui_coordinator) << "Denying this resize; will stay at" << RectUtil::toString(currentGeometry.windowFrame().size());
        m_denyNextWindowResize = false;
        return currentGeometry;
    }

    if (m_isRestoring) {
        // No size changes until the restore is done
        if (m_priorState.layoutSpec) {
            if (m_priorState.layoutSpec->isMusicMode() && m_priorState.musicModeGeometry) {
                return m_priorState.musicModeGeometry->toWindowGeometry();
            }
            if (m_priorState.layoutSpec->mode() == WindowMode::Windowed && m_priorState.windowedModeGeometry) {
                return *m_priorState.windowedModeGeometry;
            }
        }
        qCCritical(log_ui_coordinator) << "Failed to restore window frame; returning existing"
                                       << RectUtil::toString(currentGeometry.windowFrame().size());
        return currentGeometry;
    }

    if (!inLiveResize) {
        // Only applies to system requests, not to the user dragging an edge
        const qreal minWindowWidth = currentGeometry.minWindowWidth(m_currentLayout.mode());
        const qreal minWindowHeight = currentGeometry.minWindowHeight(m_currentLayout.mode());
        if (requestedSize.width() < minWindowWidth || requestedSize.height() < minWindowHeight) {
            qCDebug(log_ui_coordinator) << "Requested smaller than min (" << minWindowWidth << "x" << minWindowHeight
                                        << "); returning existing" << RectUtil::toString(currentGeometry.windowFrame().size());
            return currentGeometry;
        }
    }

    if (!context.lockViewportToVideoSize) {
        const WindowGeometry intendedGeometry = currentGeometry.scaleWindow(context, requestedSize,
                                                                            ScreenFitOption::NoConstraints);
        if (inLiveResize) {
            // The user picked this size; try to return to it later
            m_intendedViewportSize = IntendedViewportSize{intendedGeometry.viewportSize(), intendedGeometry.videoAspect()};
        }
        return intendedGeometry.refit(context, ScreenFitOption::KeepInVisibleScreen);
    }

    // Option A: resize height based on requested width
    const qreal widthDiff = requestedSize.width() - currentGeometry.windowFrame().width();
    const qreal requestedVideoWidth = currentGeometry.videoSize().width() + widthDiff;
    const QSizeF resizeFromWidthVideoSize(requestedVideoWidth, std::round(requestedVideoWidth / currentGeometry.videoAspect()));
    const WindowGeometry resizeFromWidthGeometry = currentGeometry.scaleVideo(context, resizeFromWidthVideoSize);

    // Option B: resize width based on requested height
    const qreal heightDiff = requestedSize.height() - currentGeometry.windowFrame().height();
    const qreal requestedVideoHeight = currentGeometry.videoSize().height() + heightDiff;
    const QSizeF resizeFromHeightVideoSize(std::round(requestedVideoHeight * currentGeometry.videoAspect()), requestedVideoHeight);
    const WindowGeometry resizeFromHeightGeometry = currentGeometry.scaleVideo(context, resizeFromHeightVideoSize);

    WindowGeometry chosenGeometry;
    if (inLiveResize) {
        // Dragging a corner changes both sides by small, uneven steps. Pick the axis
        // once per drag so the window does not jump between the two options.
        if (!m_isLiveResizingWidth) {
            if (currentGeometry.windowFrame().height() != requestedSize.height()) {
                m_isLiveResizingWidth = false;
            } else if (currentGeometry.windowFrame().width() != requestedSize.width()) {
                m_isLiveResizingWidth = true;
            }
        }
        if (!m_isLiveResizingWidth) {
            return currentGeometry;
        }
        chosenGeometry = *m_isLiveResizingWidth ? resizeFromWidthGeometry : resizeFromHeightGeometry;
        qCDebug(log_ui_coordinator) << "Live resize REQ:" << RectUtil::toString(requestedSize)
                                    << "WIDTH:" << RectUtil::toString(resizeFromWidthGeometry.windowFrame().size())
                                    << "HEIGHT:" << RectUtil::toString(resizeFromHeightGeometry.windowFrame().size())
                                    << "chose:" << (*m_isLiveResizingWidth ? "W" : "H");
        m_intendedViewportSize = IntendedViewportSize{chosenGeometry.viewportSize(), chosenGeometry.videoAspect()};
    } else {
        // Window managers expect both dimensions to be no larger than requested
        if (resizeFromWidthGeometry.windowFrame().width() <= requestedSize.width()
            && resizeFromWidthGeometry.windowFrame().height() <= requestedSize.height()) {
            chosenGeometry = resizeFromWidthGeometry;
        } else {
            chosenGeometry = resizeFromHeightGeometry;
        }
    }
    return chosenGeometry;
}

void WindowLayoutCoordinator::endLiveResize()
{
    m_isLiveResizingWidth.reset();
}

void WindowLayoutCoordinator::setVideoScale(qreal scale)
{
    if (!m_videoSize) {
        qCWarning(log_ui_coordinator) << "Cannot set video scale before the video size is known";
        return;
    }
    if (!(scale > 0)) {
        qCWarning(log_ui_coordinator) << "Invalid video scale" << scale;
        return;
    }
    const QSizeF desiredVideoSize(std::round(m_videoSize->width() * scale), std::round(m_videoSize->height() * scale));
    qCDebug(log_ui_coordinator) << "SetVideoScale: requested scale" << scale << "- desired video size" << RectUtil::toString(desiredVideoSize);

    switch (m_currentLayout.mode()) {
    case WindowMode::Windowed:
        applyWindowGeometryInQueue([this, desiredVideoSize]() {
            const GeometryContext context = geometryContext();
            ScaleRequest request;
            request.fitOption = ScreenFitOption::NoConstraints;
            const WindowGeometry unconstrained = m_windowedModeGeometry.scaleVideo(context, desiredVideoSize, request);
            // Assume this is the new preferred size
            m_intendedViewportSize = IntendedViewportSize{unconstrained.viewportSize(), unconstrained.videoAspect()};
            return unconstrained.refit(context, ScreenFitOption::KeepInVisibleScreen);
        }, m_prefs.animationDuration);
        break;
    case WindowMode::MusicMode: {
        const std::optional<MusicModeGeometry> geometry = m_musicModeGeometry.scaleVideo(geometryContext(), desiredVideoSize);
        if (geometry) {
            applyMusicModeGeometryInQueue(*geometry);
        }
        break;
    }
    case WindowMode::FullScreen:
        break;
    }
}

void WindowLayoutCoordinator::resizeViewport(std::optional<QSizeF> desiredViewportSize, bool centerOnScreen)
{
    switch (m_currentLayout.mode()) {
    case WindowMode::Windowed:
        applyWindowGeometryInQueue([this, desiredViewportSize, centerOnScreen]() {
            const GeometryContext context = geometryContext();
            ScaleRequest request;
            request.desiredSize = desiredViewportSize;
            request.fitOption = ScreenFitOption::NoConstraints;
            const WindowGeometry unconstrained = m_windowedModeGeometry.scaleViewport(context, request);
            m_intendedViewportSize = IntendedViewportSize{unconstrained.viewportSize(), unconstrained.videoAspect()};

            const ScreenFitOption fitOption = centerOnScreen ? ScreenFitOption::CenterInVisibleScreen
                                                             : ScreenFitOption::KeepInVisibleScreen;
            return unconstrained.refit(context, fitOption);
        }, m_prefs.animationDuration);
        break;
    case WindowMode::MusicMode: {
        // Viewport and video are the same size in music mode
        const std::optional<MusicModeGeometry> geometry = m_musicModeGeometry.scaleVideo(geometryContext(), desiredViewportSize);
        if (geometry) {
            applyMusicModeGeometryInQueue(*geometry);
        }
        break;
    }
    case WindowMode::FullScreen:
        break;
    }
}

void WindowLayoutCoordinator::scaleVideoByIncrement(qreal widthStep)
{
    QSizeF currentViewportSize;
    switch (m_currentLayout.mode()) {
    case WindowMode::Windowed:
        currentViewportSize = m_windowedModeGeometry.viewportSize();
        break;
    case WindowMode::MusicMode: {
        const std::optional<QSizeF> videoSize = m_musicModeGeometry.videoSize();
        if (!videoSize) {
            return;
        }
        currentViewportSize = *videoSize;
        break;
    }
    case WindowMode::FullScreen:
        return;
    }

    const qreal aspect = RectUtil::aspect(currentViewportSize);
    if (!(aspect > 0)) {
        return;
    }
    const qreal heightStep = widthStep / aspect;
    const QSizeF desiredViewportSize(currentViewportSize.width() + widthStep, currentViewportSize.height() + heightStep);
    qCDebug(log_ui_coordinator) << "Incrementing viewport width by" << widthStep << "to" << RectUtil::toString(desiredViewportSize);
    resizeViewport(desiredViewportSize);
}

// Video size

void WindowLayoutCoordinator::applyVideoSize(const QSizeF &videoSize, bool justOpenedFile)
{
    if (!(videoSize.width() > 0 && videoSize.height() > 0)) {
        qCWarning(log_ui_coordinator) << "Ignoring invalid video size" << RectUtil::toString(videoSize);
        return;
    }

    const qreal newVideoAspect = RectUtil::aspect(videoSize);
    const std::optional<QSizeF> oldVideoSize = m_videoSize;
    m_videoSize = videoSize;

    if (m_isRestoring) {
        m_isRestoring = false;
        m_isInitialSizeDone = true;
        if (RectUtil::isSameAspect(newVideoAspect, m_videoAspect)) {
            qCDebug(log_ui_coordinator) << "Restore done; video matches the saved aspect" << m_videoAspect;
            return;
        }
        qCWarning(log_ui_coordinator) << "Saved video aspect" << m_videoAspect << "does not match the video ("
                                      << newVideoAspect << "). Resizing to correct it";
        justOpenedFile = false;
    } else if (oldVideoSize && *oldVideoSize == videoSize) {
        qCDebug(log_ui_coordinator) << "No change to video size. Taking no action";
        return;
    }

    m_videoAspect = newVideoAspect;

    if (m_currentLayout.isMusicMode()) {
        // Keep the window width and fit the height to the new aspect
        applyMusicModeGeometryInQueue(m_musicModeGeometry.withVideoAspect(newVideoAspect));
        return;
    }

    const bool isInitialSize = !m_isInitialSizeDone;
    qreal duration = m_prefs.animationDuration * 0.5;
    if (isInitialSize) {
        // The window starts small and zooms into place
        m_isInitialSizeDone = true;
        duration = m_prefs.animationDuration;
    }

    applyWindowGeometryInQueue([this, videoSize, newVideoAspect, justOpenedFile, isInitialSize]() {
        GeometryChanges changes;
        changes.videoAspect = newVideoAspect;
        const WindowGeometry windowGeometry = m_windowedModeGeometry.withChanges(changes);

        WindowGeometry newWindowGeometry;
        if (std::optional<WindowGeometry> resized = resizeAfterFileOpen(justOpenedFile, isInitialSize, windowGeometry, videoSize)) {
            newWindowGeometry = *resized;
        } else {
            newWindowGeometry = resizeMinimallyAfterVideoReconfig(windowGeometry, videoSize);
        }
        qCDebug(log_ui_coordinator) << "Applying new video size" << RectUtil::toString(videoSize) << "- window frame:"
                                    << RectUtil::toString(newWindowGeometry.windowFrame());
        return newWindowGeometry;
    }, duration);
}

std::optional<WindowGeometry> WindowLayoutCoordinator::resizeAfterFileOpen(bool justOpenedFile, bool isInitialSize,
                                                                           const WindowGeometry &windowGeometry,
                                                                           const QSizeF &videoSize) const
{
    switch (m_prefs.resizeWindowTiming) {
    case ResizeWindowTiming::Always:
        break;
    case ResizeWindowTiming::OnlyWhenOpen:
        if (!justOpenedFile) {
            return std::nullopt;
        }
        break;
    case ResizeWindowTiming::Never:
        return std::nullopt;
    }

    const GeometryContext context = geometryContext();
    const ScreenInfo screen = context.screens.screenOrDefault(windowGeometry.screenID());
    // A new window is sized to the video without margins, even if empty space is allowed
    const std::optional<bool> forceLockViewportToVideo = isInitialSize ? std::optional<bool>(true) : std::nullopt;

    switch (m_prefs.resizeWindowScheme) {
    case ResizeWindowScheme::MpvGeometry: {
        const std::optional<GeometryDef> geometryDef = GeometryDef::parse(m_prefs.geometryDirective);
        if (!geometryDef) {
            qCDebug(log_ui_coordinator) << "No geometry directive found. Will fall back to minimal resize";
            return std::nullopt;
        }
        WindowGeometry preferredGeometry = windowGeometry;
        if (m_prefs.isViewportLockedToVideo() && m_intendedViewportSize) {
            preferredGeometry = windowGeometry.scaleViewport(context, m_intendedViewportSize->size);
        }
        qCDebug(log_ui_coordinator) << "Applying geometry" << geometryDef->toString() << "within screen"
                                    << RectUtil::toString(screen.visibleFrame);
        return windowGeometry.apply(*geometryDef, preferredGeometry.videoSize(), context);
    }
    case ResizeWindowScheme::SimpleVideoSizeMultiple: {
        ScaleRequest request;
        request.fitOption = ScreenFitOption::CenterInVisibleScreen;
        request.lockViewportToVideoSize = forceLockViewportToVideo;
        if (m_prefs.resizeWindowOption == ResizeWindowOption::FitScreen) {
            request.desiredSize = screen.visibleFrame.size();
            return windowGeometry.scaleViewport(context, request);
        }
        const qreal ratio = resizeWindowRatio(m_prefs.resizeWindowOption);
        const QSizeF newVideoSize(videoSize.width() * ratio, videoSize.height() * ratio);
        return windowGeometry.scaleVideo(context, newVideoSize, request);
    }
    }
    return std::nullopt;
}

WindowGeometry WindowLayoutCoordinator::resizeMinimallyAfterVideoReconfig(const WindowGeometry &windowGeometry,
                                                                          const QSizeF &videoSize) const
{
    // Keep the window width. Vertical videos may still end up narrower.
    QSizeF desiredViewportSize = windowGeometry.viewportSize();

    if (m_prefs.isViewportLockedToVideo()) {
        if (m_intendedViewportSize) {
            desiredViewportSize = m_intendedViewportSize->size;
        }
        const qreal minNewViewportHeight = std::round(desiredViewportSize.width() / RectUtil::aspect(videoSize));
        if (desiredViewportSize.height() < minNewViewportHeight) {
            // May still be shrunk to fit the screen
            desiredViewportSize.setHeight(minNewViewportHeight);
        }
    }
    qCDebug(log_ui_coordinator) << "Minimal resize to viewport" << RectUtil::toString(desiredViewportSize);
    return windowGeometry.scaleViewport(geometryContext(), desiredViewportSize);
}

// Cropping

void WindowLayoutCoordinator::cropVideo(const QSizeF &videoSizeUnscaled, const QRectF &cropbox)
{
    const WindowGeometry cropped = m_windowedModeGeometry.cropVideo(videoSizeUnscaled, cropbox);
    m_videoAspect = cropped.videoAspect();
    if (m_currentLayout.isMusicMode()) {
        m_windowedModeGeometry = cropped;
        applyMusicModeGeometryInQueue(m_musicModeGeometry.withVideoAspect(m_videoAspect));
        return;
    }
    applyWindowGeometryInQueue([this, videoSizeUnscaled, cropbox]() {
        return m_windowedModeGeometry.cropVideo(videoSizeUnscaled, cropbox);
    }, m_prefs.animationDuration);
}

void WindowLayoutCoordinator::uncropVideo(const QSizeF &videoDisplaySize, const QRectF &cropbox, qreal videoScale)
{
    const WindowGeometry uncropped = m_windowedModeGeometry.uncropVideo(geometryContext(), videoDisplaySize, cropbox, videoScale);
    m_videoAspect = uncropped.videoAspect();
    if (m_currentLayout.isMusicMode()) {
        m_windowedModeGeometry = uncropped;
        applyMusicModeGeometryInQueue(m_musicModeGeometry.withVideoAspect(m_videoAspect));
        return;
    }
    applyWindowGeometryInQueue([this, videoDisplaySize, cropbox, videoScale]() {
        return m_windowedModeGeometry.uncropVideo(geometryContext(), videoDisplaySize, cropbox, videoScale);
    }, m_prefs.animationDuration);
}

// Applying geometry

void WindowLayoutCoordinator::applyWindowGeometryInQueue(const GeometryBuilder &buildGeometry, qreal duration)
{
    const int ticket = ++m_geometryTicketCounter;
    m_animationQueue->addTask(AnimationTask(duration, TimingCurve::EaseInEaseOut, [this, buildGeometry, duration, ticket]() {
        if (ticket != m_geometryTicketCounter) {
            qCDebug(log_ui_coordinator) << "Skipping stale geometry update (tkt" << ticket << "<" << m_geometryTicketCounter << ")";
            return;
        }
        // Starts from the bars of whatever transition ran ahead of it
        const WindowGeometry geometry = buildGeometry();
        qCDebug(log_ui_coordinator) << "ApplyWindowGeometry (tkt" << ticket << ") windowFrame:"
                                    << RectUtil::toString(geometry.windowFrame());
        applyWindowGeometry(geometry, duration * m_animationQueue->durationScale());
    }));
}

void WindowLayoutCoordinator::applyWindowGeometry(const WindowGeometry &geometry, qreal duration)
{
    switch (m_currentLayout.mode()) {
    case WindowMode::MusicMode:
        qCCritical(log_ui_coordinator) << "applyWindowGeometry is not used in music mode";
        return;
    case WindowMode::FullScreen: {
        // Full screen shares its screen with windowed mode
        m_windowedModeGeometry = geometry;
        const WindowGeometry fullScreenGeometry = m_currentLayout.buildFullScreenGeometry(
            m_host->screens().screenOrDefault(geometry.screenID()), geometry.videoAspect());
        m_host->setWindowGeometry(fullScreenGeometry, 0, TimingCurve::Linear);
        return;
    }
    case WindowMode::Windowed:
        m_windowedModeGeometry = geometry;
        m_host->setWindowGeometry(geometry, duration, TimingCurve::EaseInEaseOut);
        emit geometryApplied(geometry.windowFrame());
        return;
    }
}

void WindowLayoutCoordinator::applyMusicModeGeometryInQueue(const MusicModeGeometry &geometry)
{
    const qreal duration = m_prefs.animationDuration;
    m_animationQueue->addTask(AnimationTask(duration, TimingCurve::EaseInEaseOut, [this, geometry, duration]() {
        // Enforces its own constraints and keeps it on screen
        const MusicModeGeometry refitGeometry = geometry.refit(geometryContext());
        qCDebug(log_ui_coordinator) << "Applying" << refitGeometry;
        m_musicModeGeometry = refitGeometry;
        if (!m_currentLayout.isMusicMode()) {
            return;
        }
        m_host->setWindowGeometry(refitGeometry.toWindowGeometry(), duration * m_animationQueue->durationScale(),
                                  TimingCurve::EaseInEaseOut);
        emit geometryApplied(refitGeometry.windowFrame());
    }));
}

void WindowLayoutCoordinator::updateCachedGeometry(const QRectF &windowFrame, const QString &screenID)
{
    if (m_currentLayout.isFullScreen() || m_isRestoring) {
        qCDebug(log_ui_coordinator) << "Not updating cached geometry: isFS=" << m_currentLayout.isFullScreen()
                                    << "isRestoring=" << m_isRestoring;
        return;
    }

    const int ticket = ++m_cachedGeometryTicketCounter;
    m_animationQueue->addTask(AnimationTask::instant([this, windowFrame, screenID, ticket]() {
        if (ticket != m_cachedGeometryTicketCounter) {
            return;
        }
        qCDebug(log_ui_coordinator) << "Updating cached" << toString(m_currentLayout.mode())
                                    << "geometry from window (tkt" << ticket << ")";
        switch (m_currentLayout.mode()) {
        case WindowMode::Windowed:
            // Aspect only changes through applyVideoSize() or cropping
            m_windowedModeGeometry = m_currentLayout.buildGeometry(windowFrame, screenID, m_windowedModeGeometry.videoAspect());
            break;
        case WindowMode::MusicMode:
            m_musicModeGeometry = m_musicModeGeometry.withWindowFrame(windowFrame).withScreenID(screenID);
            break;
        case WindowMode::FullScreen:
            break;
        }
    }));
}

PlayerSaveState WindowLayoutCoordinator::saveState() const
{
    PlayerSaveState state;
    state.layoutSpec = m_currentLayout.spec();
    state.windowedModeGeometry = m_windowedModeGeometry;
    state.musicModeGeometry = m_musicModeGeometry;
    state.videoAspect = m_videoAspect;
    return state;
}
