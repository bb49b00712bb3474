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

#ifndef WINDOWGEOMETRY_H
#define WINDOWGEOMETRY_H

#include <QRectF>
#include <QSizeF>
#include <QString>
#include <QDebug>
#include <optional>

#include "boxquad.h"
#include "geometrytypes.h"
#include "screeninfo.h"
#include "global.h"

class GeometryDef;

/**
 * @brief Optional overrides for each of the four bars
 *
 * Fields left empty keep the existing value.
 */
struct BarChanges
{
    std::optional<qreal> top;
    std::optional<qreal> trailing;
    std::optional<qreal> bottom;
    std::optional<qreal> leading;

    static BarChanges from(const BoxQuad &quad) {
        BarChanges changes;
        changes.top = quad.top;
        changes.trailing = quad.trailing;
        changes.bottom = quad.bottom;
        changes.leading = quad.leading;
        return changes;
    }

    BoxQuad appliedTo(const BoxQuad &quad) const {
        return BoxQuad(top.value_or(quad.top), trailing.value_or(quad.trailing),
                       bottom.value_or(quad.bottom), leading.value_or(quad.leading));
    }

    bool isEmpty() const { return !top && !trailing && !bottom && !leading; }
};

/**
 * @brief Partial update applied by WindowGeometry::withChanges()
 *
 * Every field left empty is copied from the source geometry. The video size is
 * always re-derived.
 */
struct GeometryChanges
{
    std::optional<QRectF> windowFrame;
    std::optional<QString> screenID;
    std::optional<ScreenFitOption> fitOption;
    std::optional<WindowMode> mode;
    std::optional<qreal> topMarginHeight;
    BarChanges outsideBars;
    BarChanges insideBars;
    std::optional<BoxQuad> viewportMargins;
    std::optional<qreal> videoAspect;
};

/**
 * @brief Screens and settings the geometry calculus reads but does not own
 */
struct GeometryContext
{
    ScreenList screens;
    bool lockViewportToVideoSize = false;
    bool moveWindowIntoVisibleScreen = true;
    bool allowVideoToOverlapCameraHousing = false;
    qreal musicModeMaxWindowWidth = MusicModeConst::DEFAULT_MAX_WINDOW_WIDTH;
};

/**
 * @brief Parameters of a viewport or video scale request
 */
struct ScaleRequest
{
    std::optional<QSizeF> desiredSize;
    std::optional<QString> screenID;
    std::optional<ScreenFitOption> fitOption;
    std::optional<WindowMode> mode;
    /// Overrides GeometryContext::lockViewportToVideoSize when set
    std::optional<bool> lockViewportToVideoSize;
};

/**
 * @brief Immutable description of a player window's frame and its parts
 *
 * Describes:
 * - the window frame (bottom-left origin, y up)
 * - the height or width of each of the 4 bars outside the viewport
 * - the height or width of each of the 4 bars inside (overlapping) the viewport
 * - the extra black margin above the top bar covering a camera housing
 * - the video aspect ratio and the video size derived from all of the above
 *
 * The viewport is the window frame minus the outside bars and the top margin. It
 * contains the video plus any inside bars, and may be larger than the video when
 * empty space around the video is allowed.
 *
 * Instances are never mutated. Every change goes through withChanges() or one of the
 * scale/resize functions, each of which returns a new geometry with a re-derived
 * video size.
 */
class WindowGeometry
{
public:
    /**
     * @brief Zero-sized windowed geometry with a 16:9 aspect
     */
    WindowGeometry();

    /**
     * @brief Derives video size and viewport margins from the given values
     *
     * Negative bar sizes are clamped to 0 and a non-positive aspect ratio is replaced
     * with the no-video default, each with a warning.
     */
    WindowGeometry(const QRectF &windowFrame, const QString &screenID, ScreenFitOption fitOption,
                   WindowMode mode, qreal topMarginHeight,
                   const BoxQuad &outsideBars, const BoxQuad &insideBars,
                   qreal videoAspect, std::optional<BoxQuad> viewportMargins = std::nullopt);

    /**
     * @brief Geometry filling @p screen for full screen
     *
     * Legacy full screen covers the whole screen frame and adds a top margin equal to
     * the camera housing height (0 if the video may overlap it). Native full screen
     * uses the frame without the camera housing.
     */
    static WindowGeometry forFullScreen(const ScreenInfo &screen, bool legacy, WindowMode mode,
                                        const BoxQuad &outsideBars, const BoxQuad &insideBars,
                                        qreal videoAspect, bool allowVideoToOverlapCameraHousing);

    static QRectF fullScreenWindowFrame(const ScreenInfo &screen, bool legacy);

    // Stored values
    const QRectF &windowFrame() const { return m_windowFrame; }
    const QString &screenID() const { return m_screenID; }
    ScreenFitOption fitOption() const { return m_fitOption; }
    WindowMode mode() const { return m_mode; }
    qreal topMarginHeight() const { return m_topMarginHeight; }
    const BoxQuad &outsideBars() const { return m_outsideBars; }
    const BoxQuad &insideBars() const { return m_insideBars; }
    const BoxQuad &viewportMargins() const { return m_viewportMargins; }
    qreal videoAspect() const { return m_videoAspect; }
    const QSizeF &videoSize() const { return m_videoSize; }

    // Derived values
    QSizeF viewportSize() const;
    QSizeF outsideBarsTotalSize() const;
    QRectF viewportFrameInScreen() const;
    QRectF videoFrameInWindow() const;
    QRectF videoFrameInScreen() const;
    bool hasTopPaddingForCameraHousing() const { return m_topMarginHeight > 0; }

    /// False if the outside bars and top margin do not fit in the window frame
    bool isValid() const;

    // Minimums
    static QSizeF computeMinVideoSize(qreal videoAspect, WindowMode mode);
    qreal minViewportWidth(WindowMode mode) const;
    qreal minViewportHeight(WindowMode mode) const;
    qreal minWindowWidth(WindowMode mode) const;
    qreal minWindowHeight(WindowMode mode) const;
    QSizeF minWindowSize() const { return QSizeF(minWindowWidth(m_mode), minWindowHeight(m_mode)); }

    /**
     * @brief Largest size with @p videoAspect that fits in @p containerSize minus @p margins
     *
     * Returns an empty size for an empty container. Results are snapped to the container
     * edges (within 1 unit) or rounded to whole numbers.
     */
    static QSizeF fitVideoToContainer(qreal videoAspect, const QSizeF &containerSize,
                                      const BoxQuad &margins = BoxQuad());

    /**
     * @brief Margins placing the video inside the viewport
     *
     * Centers the video, except in windowed mode where it is moved out from under
     * inside sidebars when there is room. Music mode never has margins.
     */
    static BoxQuad computeBestViewportMargins(const QSizeF &viewportSize, const QSizeF &videoSize,
                                              const BoxQuad &insideBars, WindowMode mode);

    /**
     * @brief Frame the window must stay inside for @p fitOption, if any
     */
    static std::optional<QRectF> containerFrame(const ScreenInfo &screen, ScreenFitOption fitOption);

    /**
     * @brief Copy with overrides. The video size is always re-derived.
     */
    WindowGeometry withChanges(const GeometryChanges &changes) const;

    /**
     * @brief Attempt to attain the requested viewport size
     *
     * The result is clamped to the minimum viewport size and, when the fit option has a
     * container, to the container minus the outside bars. With lockViewportToVideoSize the
     * viewport shrinks to the video. The window keeps its center, then is moved inside its
     * container (and centered for CenterInVisibleScreen). CenterInVisibleScreen becomes
     * KeepInVisibleScreen unless requested again explicitly.
     */
    WindowGeometry scaleViewport(const GeometryContext &context, const ScaleRequest &request = ScaleRequest()) const;
    WindowGeometry scaleViewport(const GeometryContext &context, const QSizeF &desiredViewportSize) const;

    /**
     * @brief Like scaleViewport() but takes a window size, including outside bars
     */
    WindowGeometry scaleWindow(const GeometryContext &context, const QSizeF &desiredWindowSize,
                               std::optional<ScreenFitOption> fitOption = std::nullopt) const;

    /**
     * @brief Attempt to attain the requested video size
     *
     * Derives the implied viewport size (equal to the video when locked, otherwise the
     * current viewport scaled by the video's scale change) and delegates to scaleViewport().
     * Full screen fit options are invalid here and are replaced with NoConstraints.
     */
    WindowGeometry scaleVideo(const GeometryContext &context, const QSizeF &desiredVideoSize,
                              const ScaleRequest &request = ScaleRequest()) const;

    WindowGeometry refit(const GeometryContext &context, std::optional<ScreenFitOption> fitOption = std::nullopt) const;

    /**
     * @brief Resize outside bars, keeping the opposite window edges fixed
     *
     * Top and trailing changes grow the frame away from the origin; bottom and leading
     * changes also move the origin by the same delta.
     */
    WindowGeometry withResizedOutsideBars(const BarChanges &outsideBars) const;

    /**
     * @brief Resize inside and outside bars, then re-run scaleViewport()
     */
    WindowGeometry withResizedBars(const GeometryContext &context,
                                   const BarChanges &outsideBars, const BarChanges &insideBars,
                                   std::optional<ScreenFitOption> fitOption = std::nullopt,
                                   std::optional<qreal> videoAspect = std::nullopt) const;

    /**
     * @brief Place and size the window per an external geometry directive
     * @param desiredVideoSize video size used when the directive sets no size
     */
    WindowGeometry apply(const GeometryDef &geometryDef, const QSizeF &desiredVideoSize,
                         const GeometryContext &context) const;

    /**
     * @brief Shrink the window to @p cropbox, given in the coordinates of @p videoSizeUnscaled
     *
     * The cropbox origin is the lower left of the video.
     */
    WindowGeometry cropVideo(const QSizeF &videoSizeUnscaled, const QRectF &cropbox) const;

    /**
     * @brief Grow the window back from a crop to the full @p videoDisplaySize
     */
    WindowGeometry uncropVideo(const GeometryContext &context, const QSizeF &videoDisplaySize,
                               const QRectF &cropbox, qreal videoScale) const;

    bool operator==(const WindowGeometry &other) const;
    bool operator!=(const WindowGeometry &other) const { return !(*this == other); }

    QString toString() const;

private:
    static QSizeF deriveViewportSize(const QRectF &windowFrame, qreal topMarginHeight, const BoxQuad &outsideBars);
    static qreal minVideoWidth(WindowMode mode);
    static qreal minVideoHeight(WindowMode mode);
    QSizeF computeMaxViewportSize(const QSizeF &containerSize) const;
    QSizeF computeMaxVideoSize(const QSizeF &containerSize) const;
    bool isViewportLocked(const GeometryContext &context, WindowMode mode, std::optional<bool> requested) const;

    QRectF m_windowFrame;
    QString m_screenID;
    ScreenFitOption m_fitOption;
    WindowMode m_mode;
    qreal m_topMarginHeight;
    BoxQuad m_outsideBars;
    BoxQuad m_insideBars;
    BoxQuad m_viewportMargins;
    qreal m_videoAspect;
    QSizeF m_videoSize;
};

QDebug operator<<(QDebug dbg, const WindowGeometry &geometry);

#endif // WINDOWGEOMETRY_H
