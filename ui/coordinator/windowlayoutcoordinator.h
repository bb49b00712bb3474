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

#ifndef WINDOWLAYOUTCOORDINATOR_H
#define WINDOWLAYOUTCOORDINATOR_H

#include <QObject>
#include <QRectF>
#include <QSizeF>
#include <QLoggingCategory>
#include <functional>
#include <optional>

#include "layout/layoutstate.h"
#include "layout/layoutpreferences.h"
#include "geometry/windowgeometry.h"
#include "geometry/musicmodegeometry.h"
#include "transition/transitionplanner.h"
#include "state/playersavestate.h"
#include "ui/animationqueue.h"

Q_DECLARE_LOGGING_CATEGORY(log_ui_coordinator)

class PlayerWindowHost;

/**
 * @brief Owns the layout and geometry of one player window
 *
 * This class handles all window layout-related operations including:
 * - Building layout transitions and running them through the AnimationQueue
 * - Window resize requests, live and programmatic
 * - Fullscreen and music mode changes
 * - Video size changes and scaling
 * - Saving and restoring the window state
 *
 * All state lives here. The PlayerWindowHost only draws what it is told. Transitions
 * are built when the queue reaches them, so each one starts from the layout left by
 * the one before it.
 */
class WindowLayoutCoordinator : public QObject
{
    Q_OBJECT

public:
    /**
     * @brief Construct a new Window Layout Coordinator
     * @param host Window to drive (not owned)
     * @param prefs Current layout settings
     * @param parent Parent QObject
     */
    explicit WindowLayoutCoordinator(PlayerWindowHost *host,
                                     const LayoutPreferences &prefs,
                                     QObject *parent = nullptr);

    ~WindowLayoutCoordinator();

    const LayoutState &currentLayout() const { return m_currentLayout; }
    const WindowGeometry &windowedModeGeometry() const { return m_windowedModeGeometry; }
    const MusicModeGeometry &musicModeGeometry() const { return m_musicModeGeometry; }
    qreal videoAspect() const { return m_videoAspect; }
    const LayoutPreferences &preferences() const { return m_prefs; }
    const std::optional<IntendedViewportSize> &intendedViewportSize() const { return m_intendedViewportSize; }
    bool isRestoring() const { return m_isRestoring; }
    AnimationQueue *animationQueue() const { return m_animationQueue; }

    /**
     * @brief Geometry of the window in its current mode
     */
    WindowGeometry currentGeometry() const;

    /**
     * @brief Lay out the window as it opens
     *
     * Restores @p priorState if it has a layout, else builds the layout from the
     * settings. Runs synchronously. A restored layout which no longer matches the
     * settings is corrected with a follow-up transition.
     */
    void setInitialLayout(const PlayerSaveState &priorState = PlayerSaveState());

    /**
     * @brief Animate to the layout of @p spec
     */
    void transitionTo(const LayoutSpec &spec, const QString &name);

    void enterFullScreen();
    void exitFullScreen();
    void toggleFullScreen();
    void enterMusicMode();
    void exitMusicMode();

    /**
     * @brief Open the sidebar hosting @p tab
     *
     * Inside sidebars which would leave too little room between them are closed.
     */
    void showSidebar(const SidebarTab &tab);
    void hideSidebar(SidebarLocation location);
    void hideSidebars();

    /**
     * @brief Adopt new settings and transition to the layout they describe
     */
    void applyPreferences(const LayoutPreferences &prefs);

    /**
     * @brief Decide the geometry for a resize request coming from the window
     * @param requestedSize window size asked for by the user or the system
     * @param inLiveResize true while the user drags a window edge
     * @return geometry the window should take. Not applied or cached here.
     */
    WindowGeometry resizeWindow(const QSizeF &requestedSize, bool inLiveResize);

    /// Forget the resize axis chosen during the last drag
    void endLiveResize();

    /// The next resizeWindow() call keeps the current size
    void denyNextWindowResize() { m_denyNextWindowResize = true; }

    /**
     * @brief Resize so the video is @p scale times its native size
     */
    void setVideoScale(qreal scale);

    /**
     * @brief Resize toward @p desiredViewportSize, keeping the window inside the screen
     */
    void resizeViewport(std::optional<QSizeF> desiredViewportSize = std::nullopt, bool centerOnScreen = false);

    /**
     * @brief Grow or shrink the viewport by @p widthStep, keeping its aspect
     */
    void scaleVideoByIncrement(qreal widthStep);

    /**
     * @brief Adjust the window to a new video size
     * @param videoSize display size of the video, after aspect override and rotation
     * @param justOpenedFile true for the first size of a newly opened file
     */
    void applyVideoSize(const QSizeF &videoSize, bool justOpenedFile);

    void cropVideo(const QSizeF &videoSizeUnscaled, const QRectF &cropbox);
    void uncropVideo(const QSizeF &videoDisplaySize, const QRectF &cropbox, qreal videoScale);

    /**
     * @brief Record the frame the window ended up with after the user moved or resized it
     *
     * Applied from the queue. A newer call made before the queue gets to it replaces it.
     */
    void updateCachedGeometry(const QRectF &windowFrame, const QString &screenID);

    PlayerSaveState saveState() const;

signals:
    /**
     * @brief Emitted when a transition has finished and @p layout is current
     */
    void layoutChanged(const LayoutState &layout);

    /**
     * @brief Emitted when a new window frame is handed to the window
     */
    void geometryApplied(const QRectF &windowFrame);

    /**
     * @brief Emitted when fullscreen state changes
     * @param isFullscreen True if entering fullscreen, false if exiting
     */
    void fullscreenChanged(bool isFullscreen);

    void transitionFinished(const QString &name);

private:
    using SpecBuilder = std::function<std::optional<LayoutSpec>(const LayoutState &current)>;
    using GeometryBuilder = std::function<WindowGeometry()>;

    TransitionContext transitionContext() const;
    GeometryContext geometryContext() const;
    ScreenInfo windowedModeScreen() const;
    WindowGeometry defaultWindowedGeometry() const;

    /**
     * @brief Queue a transition whose target is decided when the queue reaches it
     * @param instant run every step with zero duration
     */
    void enqueueTransition(const QString &name, const SpecBuilder &buildSpec, bool instant = false);
    QList<AnimationTask> buildTasks(const LayoutTransition &transition, bool instant);
    void executeOperation(const LayoutTransition &transition, const TransitionOperation &operation, qreal duration);
    void finishTransition(const LayoutTransition &transition);

    std::optional<WindowGeometry> resizeAfterFileOpen(bool justOpenedFile, bool isInitialSize,
                                                      const WindowGeometry &windowGeometry,
                                                      const QSizeF &videoSize) const;
    WindowGeometry resizeMinimallyAfterVideoReconfig(const WindowGeometry &windowGeometry,
                                                     const QSizeF &videoSize) const;

    /**
     * @brief Queue a window geometry change
     *
     * @p buildGeometry runs when the queue reaches the task, so it sees the layout
     * committed by any transition queued before it. Superseded requests are skipped.
     */
    void applyWindowGeometryInQueue(const GeometryBuilder &buildGeometry, qreal duration);
    void applyWindowGeometry(const WindowGeometry &geometry, qreal duration);
    void applyMusicModeGeometryInQueue(const MusicModeGeometry &geometry);

    // Member variables
    PlayerWindowHost *m_host;                       ///< Window being laid out (not owned)
    AnimationQueue *m_animationQueue;               ///< Runs transitions and geometry updates in order
    LayoutPreferences m_prefs;

    LayoutState m_currentLayout;
    WindowGeometry m_windowedModeGeometry;          ///< Also kept while in full screen or music mode
    MusicModeGeometry m_musicModeGeometry;
    qreal m_videoAspect;
    std::optional<QSizeF> m_videoSize;              ///< Display size of the current video, once known

    int m_geometryTicketCounter = 0;                ///< Newest applyWindowGeometryInQueue() request
    int m_cachedGeometryTicketCounter = 0;          ///< Newest updateCachedGeometry() request
    std::optional<bool> m_isLiveResizingWidth;      ///< Resize axis latched for the current drag
    std::optional<IntendedViewportSize> m_intendedViewportSize;
    bool m_denyNextWindowResize = false;
    bool m_isRestoring = false;
    bool m_isInitialSizeDone = false;
    PlayerSaveState m_priorState;
};

#endif // WINDOWLAYOUTCOORDINATOR_H
